#ifndef SWAPTRADE_STORE_HPP
#define SWAPTRADE_STORE_HPP

#include <optional>
#include <string>

namespace swaptrade {

// =============================================================================
// State Store (host persistence collaborator)
// =============================================================================

class IStateStore {
public:
    virtual ~IStateStore() = default;

    // nullopt when nothing has been stored yet
    virtual std::optional<std::string> load() = 0;
    virtual void store(const std::string& blob) = 0;
};

class MemoryStateStore : public IStateStore {
public:
    std::optional<std::string> load() override { return blob_; }
    void store(const std::string& blob) override { blob_ = blob; }

private:
    std::optional<std::string> blob_;
};

// Whole-file blob; store() writes a sibling temp file and renames it over
// the target. I/O failures throw std::runtime_error.
class FileStateStore : public IStateStore {
public:
    explicit FileStateStore(std::string path) : path_(std::move(path)) {}

    std::optional<std::string> load() override;
    void store(const std::string& blob) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace swaptrade

#endif // SWAPTRADE_STORE_HPP
