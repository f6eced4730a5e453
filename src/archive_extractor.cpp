#include "downqueue/archive_extractor.hpp"
#include "downqueue/errors.hpp"

#include <algorithm>
#include <memory>
#include <system_error>
#include <utility>

#include <archive.h>
#include <archive_entry.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace downqueue {

namespace fs = std::filesystem;

namespace {

constexpr size_t kOpenBlockSize = 10240;

using ArchiveReader = std::unique_ptr<archive, decltype(&archive_read_free)>;
using ArchiveWriter = std::unique_ptr<archive, decltype(&archive_write_free)>;

std::string errorOf(archive* a) {
    const char* message = archive_error_string(a);
    return message ? message : "unknown archive error";
}

ArchiveReader openReader(const fs::path& path) {
    ArchiveReader reader{archive_read_new(), &archive_read_free};
    if (!reader) {
        throw StageError("Failed to allocate archive reader");
    }
    archive_read_support_filter_all(reader.get());
    archive_read_support_format_all(reader.get());
    if (archive_read_open_filename(reader.get(), path.c_str(), kOpenBlockSize) != ARCHIVE_OK) {
        throw StageError(fmt::format("Cannot open archive {}: {}", path.filename().string(), errorOf(reader.get())));
    }
    return reader;
}

} // namespace

bool isWithinDirectory(const fs::path& base, const fs::path& target) {
    const fs::path relative = target.lexically_relative(base);
    if (relative.empty()) {
        return false;
    }
    const auto first = relative.begin();
    return first == relative.end() || *first != "..";
}

ArchiveExtractor::ArchiveExtractor(fs::path archive, fs::path dest_dir)
    : archive_(std::move(archive)), dest_dir_(std::move(dest_dir)) {}

void ArchiveExtractor::extract(const TransferCallback& on_progress) {
    fs::create_directories(dest_dir_);
    dest_dir_ = fs::weakly_canonical(dest_dir_);

    validate();
    try {
        unpack(on_progress);
    } catch (...) {
        // 回滚后原样抛出
        rollback();
        throw;
    }
}

fs::path ArchiveExtractor::resolveEntry(const std::string& name) const {
    const fs::path entry(name);
    if (entry.is_absolute() || entry.has_root_name() || entry.has_root_directory()) {
        throw PathEscapeError(name);
    }
    fs::path target = fs::weakly_canonical(dest_dir_ / entry);
    if (target != dest_dir_ && !isWithinDirectory(dest_dir_, target)) {
        throw PathEscapeError(name);
    }
    return target;
}

void ArchiveExtractor::validate() {
    ArchiveReader reader = openReader(archive_);
    total_bytes_ = 0;

    archive_entry* entry = nullptr;
    int rc = ARCHIVE_OK;
    while ((rc = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK || rc == ARCHIVE_WARN) {
        const char* raw = archive_entry_pathname(entry);
        if (!raw || *raw == '\0') {
            continue;
        }
        const std::string name(raw);
        const fs::path target = resolveEntry(name);

        if (const char* link = archive_entry_symlink(entry)) {
            const fs::path link_path(link);
            if (link_path.is_absolute() || link_path.has_root_name()) {
                throw PathEscapeError(name + " -> " + link);
            }
            const fs::path resolved = fs::weakly_canonical(target.parent_path() / link_path);
            if (resolved != dest_dir_ && !isWithinDirectory(dest_dir_, resolved)) {
                throw PathEscapeError(name + " -> " + link);
            }
        }
        if (const char* hardlink = archive_entry_hardlink(entry)) {
            resolveEntry(hardlink);
        }

        if (archive_entry_filetype(entry) == AE_IFREG && archive_entry_size_is_set(entry)) {
            total_bytes_ += static_cast<std::uint64_t>(std::max<la_int64_t>(0, archive_entry_size(entry)));
        }
        archive_read_data_skip(reader.get());
    }

    if (rc != ARCHIVE_EOF) {
        throw StageError("Corrupt archive: " + errorOf(reader.get()));
    }
}

void ArchiveExtractor::recordCreated(const fs::path& target) {
    // 记录本次新建的父目录 (从上到下), 以便回滚
    std::vector<fs::path> missing;
    for (fs::path dir = target.parent_path(); dir != dest_dir_ && isWithinDirectory(dest_dir_, dir);
         dir = dir.parent_path()) {
        std::error_code ec;
        if (fs::exists(dir, ec)) {
            break;
        }
        missing.push_back(dir);
    }
    created_.insert(created_.end(), missing.rbegin(), missing.rend());

    std::error_code ec;
    if (!fs::exists(fs::symlink_status(target, ec))) {
        created_.push_back(target);
    }
}

void ArchiveExtractor::unpack(const TransferCallback& on_progress) {
    ArchiveReader reader = openReader(archive_);
    ArchiveWriter writer{archive_write_disk_new(), &archive_write_free};
    if (!writer) {
        throw StageError("Failed to allocate archive writer");
    }
    archive_write_disk_set_options(writer.get(),
                                   ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                   ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(writer.get());
    // 条目路径已改写为校验过的绝对路径

    std::uint64_t done = 0;
    const auto report = [&]() {
        if (on_progress) {
            on_progress({done, total_bytes_, false});
        }
    };

    archive_entry* entry = nullptr;
    int rc = ARCHIVE_OK;
    while ((rc = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK || rc == ARCHIVE_WARN) {
        report();

        const char* pathname = archive_entry_pathname(entry);
        if (!pathname || *pathname == '\0') {
            continue;
        }
        const std::string raw(pathname);
        const fs::path target = resolveEntry(raw);
        recordCreated(target);
        archive_entry_set_pathname(entry, target.c_str());
        if (const char* hardlink = archive_entry_hardlink(entry)) {
            archive_entry_set_hardlink(entry, resolveEntry(hardlink).c_str());
        }

        if (archive_write_header(writer.get(), entry) < ARCHIVE_WARN) {
            throw StageError(fmt::format("Cannot extract {}: {}", raw, errorOf(writer.get())));
        }

        const void* block = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        int data_rc = ARCHIVE_OK;
        while ((data_rc = archive_read_data_block(reader.get(), &block, &size, &offset)) == ARCHIVE_OK) {
            if (archive_write_data_block(writer.get(), block, size, offset) < ARCHIVE_WARN) {
                throw StageError(fmt::format("Cannot write {}: {}", raw, errorOf(writer.get())));
            }
            done += size;
            report();
        }
        if (data_rc != ARCHIVE_EOF) {
            throw StageError(fmt::format("Corrupt archive entry {}: {}", raw, errorOf(reader.get())));
        }

        if (archive_write_finish_entry(writer.get()) < ARCHIVE_WARN) {
            throw StageError(fmt::format("Cannot finish {}: {}", raw, errorOf(writer.get())));
        }
    }

    if (rc != ARCHIVE_EOF) {
        throw StageError("Corrupt archive: " + errorOf(reader.get()));
    }
    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        throw StageError("Failed to finalize extraction: " + errorOf(writer.get()));
    }

    done = total_bytes_;
    report();
}

void ArchiveExtractor::rollback() noexcept {
    for (auto it = created_.rbegin(); it != created_.rend(); ++it) {
        std::error_code ec;
        fs::remove_all(*it, ec);
        if (ec) {
            spdlog::warn("Rollback could not remove {}: {}", it->string(), ec.message());
        }
    }
    created_.clear();
}

} // namespace downqueue
