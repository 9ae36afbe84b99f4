// Id-list phonemizer
// Splits pre-phonemized text into sentences of phoneme ids

#include "io/phonemizer.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace voxpipe {
namespace io {

namespace fs = std::filesystem;

static bool is_blank(const std::string& s) {
    for (unsigned char c : s) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

std::optional<std::vector<int64_t>> parse_id_list(const std::string& sentence) {
    std::vector<int64_t> ids;
    std::string token;

    auto flush = [&]() -> bool {
        if (token.empty()) return true;
        for (unsigned char c : token) {
            if (!std::isdigit(c)) return false;
        }
        errno = 0;
        char* end = nullptr;
        long long value = std::strtoll(token.c_str(), &end, 10);
        if (errno == ERANGE || end == nullptr || *end != '\0') return false;
        ids.push_back(static_cast<int64_t>(value));
        token.clear();
        return true;
    };

    for (char c : sentence) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == ',') {
            if (!flush()) return std::nullopt;
        } else {
            token += c;
        }
    }
    if (!flush()) return std::nullopt;
    return ids;
}

IdListPhonemizer::~IdListPhonemizer() {
    release();
}

bool IdListPhonemizer::init(const std::string& data_path) {
    last_error_.clear();
    if (!data_path.empty()) {
        std::error_code ec;
        if (fs::exists(data_path, ec) && !fs::is_directory(data_path, ec)) {
            last_error_ = "phonemizer data path is not a directory: " + data_path;
            ready_ = false;
            return false;
        }
    }
    data_path_ = data_path;
    ready_ = true;
    return true;
}

void IdListPhonemizer::release() {
    ready_ = false;
    data_path_.clear();
}

std::optional<PhonemeResult> IdListPhonemizer::process(const std::string& text, const std::string& voice) {
    last_error_.clear();
    if (!ready_) {
        last_error_ = "phonemizer used before init()";
        return std::nullopt;
    }
    last_voice_ = voice;

    PhonemeResult result;
    std::string chunk;

    auto emit = [&]() {
        if (!is_blank(chunk)) {
            size_t index = result.sentences.size();
            auto ids = parse_id_list(chunk);
            if (ids) {
                result.sentences.push_back(Sentence{index, std::move(*ids)});
            } else {
                result.sentences.push_back(std::nullopt);
            }
        }
        chunk.clear();
    };

    for (char c : text) {
        if (c == '\n' || c == '|') {
            emit();
        } else {
            chunk += c;
        }
    }
    emit();

    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

} // namespace io
} // namespace voxpipe
