#pragma once

#include <string>
#include <optional>
#include "vellum/types.hpp"

namespace vellum::engine {

    /**
     * @brief Resolves the text that represents a document in the index.
     */
    class TextSource {
    public:
        virtual ~TextSource() = default;

        /**
         * @return std::nullopt if the document has no usable text.
         */
        virtual std::optional<std::string> get_text(const DocumentRecord& record) = 0;
    };

    /**
     * @brief Abstract by default. In full-text mode, reads the pre-extracted
     * text file at record.text_path and falls back to the abstract when it is
     * missing or empty.
     */
    class PaperTextSource : public TextSource {
    public:
        explicit PaperTextSource(bool use_full_text) : m_use_full_text(use_full_text) {}

        std::optional<std::string> get_text(const DocumentRecord& record) override;

    private:
        bool m_use_full_text;
    };

}
