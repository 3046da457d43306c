#include "text_source.hpp"
#include "embedder.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace vellum::engine {

    std::optional<std::string> PaperTextSource::get_text(const DocumentRecord& record) {
        if (m_use_full_text) {
            std::error_code ec;
            if (record.text_path && std::filesystem::exists(*record.text_path, ec)) {
                std::ifstream file(*record.text_path);
                std::stringstream buffer;
                buffer << file.rdbuf();
                std::string full_text = buffer.str();
                if (file && has_content(full_text)) return full_text;
            }
            std::cerr << "[TextSource] No full text for " << record.key << "v" << record.version << ", using abstract\n";
        }

        if (!has_content(record.abstract)) return std::nullopt;
        return record.abstract;
    }

}
