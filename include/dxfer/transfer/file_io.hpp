#pragma once

#include "dxfer/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <set>
#include <string>

namespace dxfer::transfer {

/**
 * @brief Pull-style producer of payload bytes for one outgoing transfer
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * @brief Read up to capacity bytes into buffer
     *
     * @return Number of bytes read; 0 means the source is exhausted
     */
    virtual Result<std::size_t> read(std::uint8_t* buffer, std::size_t capacity) = 0;

    /// Size announced in the header
    [[nodiscard]] virtual std::uint64_t size() const = 0;

    /// Name announced in the header
    [[nodiscard]] virtual const std::string& name() const = 0;
};

/**
 * @brief Consumer of payload bytes for one incoming transfer
 *
 * Bytes are only visible under the final name after commit(). A sink
 * destroyed without commit() discards what was written.
 */
class ByteSink {
public:
    virtual ~ByteSink() = default;

    virtual Result<void> write(const std::uint8_t* data, std::size_t len) = 0;
    virtual Result<void> commit() = 0;
    virtual void abandon() noexcept = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};

/**
 * @brief Hands out a sink for each accepted header
 */
class SinkProvider {
public:
    virtual ~SinkProvider() = default;

    virtual Result<std::unique_ptr<ByteSink>> open_sink(const std::string& name,
                                                        std::uint64_t size) = 0;
};

class FileSource : public ByteSource {
    struct Passkey {};

public:
    FileSource(Passkey, std::filesystem::path path, std::ifstream input, std::uint64_t size);

    /**
     * @brief Open a regular file for sending; the header name is its basename
     */
    static Result<std::unique_ptr<FileSource>> open(const std::filesystem::path& path);

    Result<std::size_t> read(std::uint8_t* buffer, std::size_t capacity) override;

    [[nodiscard]] std::uint64_t size() const override { return size_; }
    [[nodiscard]] const std::string& name() const override { return name_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::ifstream input_;
    std::string name_;
    std::uint64_t size_;
};

class DownloadDirectory;

/**
 * @brief Sink writing to a hidden staging file, renamed onto the target on commit
 */
class FileSink : public ByteSink {
public:
    FileSink(DownloadDirectory& owner,
             std::filesystem::path target,
             std::filesystem::path staging,
             std::ofstream output);
    ~FileSink() override;

    Result<void> write(const std::uint8_t* data, std::size_t len) override;
    Result<void> commit() override;
    void abandon() noexcept override;

    [[nodiscard]] std::string describe() const override { return target_.string(); }
    [[nodiscard]] const std::filesystem::path& target() const noexcept { return target_; }

private:
    DownloadDirectory& owner_;
    std::filesystem::path target_;
    std::filesystem::path staging_;
    std::ofstream output_;
    bool finished_ = false;
};

/**
 * @brief Destination directory for received files
 *
 * NAMING:
 * The header name must be one plain path component. If "<name>" is taken,
 * "<name> (1)", "<name> (2)", ... are tried in order. A name is taken when
 * a file exists under it or under its staging name ".<name>.part", or an
 * in-flight transfer has reserved either of the two.
 *
 * Must outlive every sink it opened.
 */
class DownloadDirectory : public SinkProvider {
public:
    explicit DownloadDirectory(std::filesystem::path root);

    Result<std::unique_ptr<ByteSink>> open_sink(const std::string& name,
                                                std::uint64_t size) override;

    /**
     * @brief Pick the first free target name for name without reserving it
     */
    Result<std::filesystem::path> resolve_target(const std::string& name) const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] std::size_t in_flight() const noexcept { return reserved_.size(); }

    static Result<void> validate_name(const std::string& name);
    static std::filesystem::path staging_path_for(const std::filesystem::path& target);

private:
    friend class FileSink;

    void release(const std::filesystem::path& target) noexcept;
    [[nodiscard]] bool is_taken(const std::filesystem::path& candidate) const;

    std::filesystem::path root_;
    std::set<std::filesystem::path> reserved_;
};

} // namespace dxfer::transfer
