#include "document.hpp"
#include "block_parsers.hpp"
#include "text_utils.hpp"
#include <optional>

namespace memomark::markdown {

namespace {
    class Scanner {
    public:
        explicit Scanner(const std::vector<std::string>& lines) : lines_(lines) {}

        std::vector<BlockNode> run() {
            size_t i = 0;
            while (i < lines_.size()) {
                auto node = try_parsers(i);
                if (node) {
                    flush_paragraph();
                    i = node->end_line + 1;
                    append(std::move(*node));
                    continue;
                }

                if (paragraph_.empty()) {
                    paragraph_start_ = i;
                }
                paragraph_.push_back(is_blank(lines_[i]) ? std::string() : lines_[i]);
                i++;
            }

            flush_paragraph();

            // Trailing blank lines belong to the last block.
            if (pending_start_ && !blocks_.empty()) {
                blocks_.back().end_line = lines_.size() - 1;
            }
            return std::move(blocks_);
        }

    private:
        const std::vector<std::string>& lines_;
        std::vector<BlockNode> blocks_;
        std::vector<std::string> paragraph_;
        size_t paragraph_start_ = 0;
        std::optional<size_t> pending_start_;  // First unclaimed blank line

        std::optional<BlockNode> try_parsers(size_t index) const {
            for (BlockParser parser : block_parsers()) {
                auto node = parser(lines_, index);
                if (node) {
                    return node;
                }
            }
            return std::nullopt;
        }

        void append(BlockNode node) {
            if (pending_start_) {
                node.start_line = *pending_start_;
                pending_start_.reset();
            }
            blocks_.push_back(std::move(node));
        }

        void flush_paragraph() {
            if (paragraph_.empty()) {
                return;
            }

            bool has_text = false;
            for (const auto& line : paragraph_) {
                if (!line.empty()) {
                    has_text = true;
                    break;
                }
            }

            if (has_text) {
                BlockNode node;
                node.type = BlockType::Paragraph;
                node.start_line = paragraph_start_;
                node.end_line = paragraph_start_ + paragraph_.size() - 1;
                node.text = join_lines(paragraph_);
                append(std::move(node));
            } else if (!pending_start_) {
                pending_start_ = paragraph_start_;
            }

            paragraph_.clear();
        }
    };
}

std::vector<BlockNode> scan(const std::vector<std::string>& lines) {
    return Scanner(lines).run();
}

Document parse(const std::string& text) {
    Document doc;
    std::vector<std::string> lines = split_lines(text);
    doc.line_count = lines.size();
    doc.blocks = scan(lines);
    return doc;
}

} // namespace memomark::markdown
