// =============================================================================
// store.cpp - File-backed state store
// =============================================================================

#include "swaptrade/store.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace swaptrade {

std::optional<std::string> FileStateStore::load() {
    std::ifstream file{path_, std::ios::binary};
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Cannot read state file: " + path_);
    }
    return buffer.str();
}

void FileStateStore::store(const std::string& blob) {
    std::string tmp = path_ + ".tmp";
    {
        std::ofstream file{tmp, std::ios::binary | std::ios::trunc};
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open state file for writing: " + tmp);
        }
        file << blob;
        file.flush();
        if (!file) {
            throw std::runtime_error("Cannot write state file: " + tmp);
        }
    }
    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        std::remove(tmp.c_str());
        throw std::runtime_error("Cannot replace state file: " + path_);
    }
}

} // namespace swaptrade
