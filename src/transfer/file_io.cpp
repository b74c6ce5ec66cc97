#include "dxfer/transfer/file_io.hpp"

#include <system_error>
#include <utility>

namespace dxfer::transfer {
namespace fs = std::filesystem;

// ──────────────────────────────────────────────────────────
// FileSource
// ──────────────────────────────────────────────────────────

Result<std::unique_ptr<FileSource>> FileSource::open(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Err<std::unique_ptr<FileSource>>(ErrorKind::Io,
            "not a regular file: " + path.string());
    }

    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err<std::unique_ptr<FileSource>>(ErrorKind::Io,
            "failed to stat " + path.string() + ": " + ec.message());
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::unique_ptr<FileSource>>(ErrorKind::Io,
            "failed to open source file: " + path.string());
    }

    return Ok(std::make_unique<FileSource>(
        Passkey{}, path, std::move(input), static_cast<std::uint64_t>(size)));
}

FileSource::FileSource(Passkey, fs::path path, std::ifstream input, std::uint64_t size)
    : path_(std::move(path)),
      input_(std::move(input)),
      name_(path_.filename().string()),
      size_(size) {
}

Result<std::size_t> FileSource::read(std::uint8_t* buffer, std::size_t capacity) {
    if (input_.eof()) {
        return Ok(std::size_t{0});
    }
    input_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(capacity));
    const auto count = static_cast<std::size_t>(input_.gcount());
    if (input_.bad()) {
        return Err<std::size_t>(ErrorKind::Io, "failed to read " + path_.string());
    }
    return Ok(count);
}

// ──────────────────────────────────────────────────────────
// FileSink
// ──────────────────────────────────────────────────────────

FileSink::FileSink(DownloadDirectory& owner,
                   fs::path target,
                   fs::path staging,
                   std::ofstream output)
    : owner_(owner),
      target_(std::move(target)),
      staging_(std::move(staging)),
      output_(std::move(output)) {
}

FileSink::~FileSink() {
    abandon();
}

Result<void> FileSink::write(const std::uint8_t* data, std::size_t len) {
    if (finished_) {
        return Err<void>(ErrorKind::Io, "write to finished sink " + target_.string());
    }
    output_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
    if (!output_) {
        return Err<void>(ErrorKind::Io, "failed to write " + staging_.string());
    }
    return Ok();
}

Result<void> FileSink::commit() {
    if (finished_) {
        return Err<void>(ErrorKind::Io, "sink already finished: " + target_.string());
    }
    output_.close();
    if (!output_) {
        abandon();
        return Err<void>(ErrorKind::Io, "failed to flush " + staging_.string());
    }

    std::error_code ec;
    fs::rename(staging_, target_, ec);
    if (ec) {
        abandon();
        return Err<void>(ErrorKind::Io,
            "failed to move " + staging_.string() + " to " + target_.string() + ": " + ec.message());
    }

    finished_ = true;
    owner_.release(target_);
    return Ok();
}

void FileSink::abandon() noexcept {
    if (finished_) {
        return;
    }
    finished_ = true;
    if (output_.is_open()) {
        output_.close();
    }
    std::error_code ec;
    fs::remove(staging_, ec);
    owner_.release(target_);
}

// ──────────────────────────────────────────────────────────
// DownloadDirectory
// ──────────────────────────────────────────────────────────

DownloadDirectory::DownloadDirectory(fs::path root)
    : root_(std::move(root)) {
}

Result<void> DownloadDirectory::validate_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return Err<void>(ErrorKind::ProtocolViolation, "invalid file name '" + name + "'");
    }
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos ||
        name.find('\0') != std::string::npos) {
        return Err<void>(ErrorKind::ProtocolViolation,
            "file name must not contain path separators: '" + name + "'");
    }
    return Ok();
}

fs::path DownloadDirectory::staging_path_for(const fs::path& target) {
    return target.parent_path() / ("." + target.filename().string() + ".part");
}

bool DownloadDirectory::is_taken(const fs::path& candidate) const {
    // The staging file is written with truncation, so its path must be free too
    const fs::path staging = staging_path_for(candidate);
    std::error_code ec;
    if (reserved_.count(candidate) > 0 || reserved_.count(staging) > 0) {
        return true;
    }
    return fs::exists(candidate, ec) || fs::exists(staging, ec);
}

Result<fs::path> DownloadDirectory::resolve_target(const std::string& name) const {
    if (auto valid = validate_name(name); valid.is_error()) {
        return Err<fs::path>(valid.error());
    }

    fs::path target = root_ / name;
    std::size_t count = 1;
    while (is_taken(target)) {
        target = root_ / (name + " (" + std::to_string(count) + ")");
        ++count;
    }
    return Ok(std::move(target));
}

Result<std::unique_ptr<ByteSink>> DownloadDirectory::open_sink(const std::string& name,
                                                               std::uint64_t /*size*/) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    std::error_code exists_ec;
    if (ec && !fs::is_directory(root_, exists_ec)) {
        return Err<std::unique_ptr<ByteSink>>(ErrorKind::Io,
            "failed to create download directory " + root_.string() + ": " + ec.message());
    }

    auto target = resolve_target(name);
    if (target.is_error()) {
        return Err<std::unique_ptr<ByteSink>>(target.error());
    }

    const fs::path staging = staging_path_for(target.value());
    std::ofstream output(staging, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<std::unique_ptr<ByteSink>>(ErrorKind::Io,
            "failed to create " + staging.string());
    }

    reserved_.insert(target.value());
    return Ok(std::unique_ptr<ByteSink>(
        std::make_unique<FileSink>(*this, target.value(), staging, std::move(output))));
}

void DownloadDirectory::release(const fs::path& target) noexcept {
    reserved_.erase(target);
}

} // namespace dxfer::transfer
