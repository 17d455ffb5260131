#include "vfsup/archive_unpacker.hpp"

#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <memory>
#include <string_view>

namespace vfsup {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

std::string ArchiveErr(archive* a) {
    const char* s = archive_error_string(a);
    return s ? std::string(s) : std::string("unknown libarchive error");
}

std::string CollapseSlashes(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

} // namespace

bool ArchivePathPolicy::IsSafeRelativePath(const std::string& p) {
    if (p.empty()) return false;
    if (p.front() == '/') return false;
    if (p.find('\\') != std::string::npos) return false;

    std::string_view sv(p);
    while (!sv.empty()) {
        const auto pos = sv.find('/');
        const auto seg = sv.substr(0, pos);
        if (seg == "..") return false;
        if (pos == std::string_view::npos) break;
        sv.remove_prefix(pos + 1);
    }
    return true;
}

Result ArchivePathPolicy::Normalize(const char* raw_path, std::string& out_relative) {
    const std::string raw = raw_path ? std::string(raw_path) : std::string();
    if (!raw.empty() && raw.front() == '/') {
        return Result::Fail("Absolute path in archive: " + raw);
    }

    out_relative = CollapseSlashes(raw);
    if (out_relative.empty() || out_relative == ".") {
        out_relative.clear();
        return Result::Ok();
    }
    if (!IsSafeRelativePath(out_relative)) {
        return Result::Fail("Unsafe path in archive: " + out_relative);
    }
    return Result::Ok();
}

Result ArchiveUnpacker::UnpackToDir(const std::string& archive_path, const std::string& dst_dir) const {
    namespace fs = std::filesystem;

    const fs::path base_dir(dst_dir);
    std::error_code ec;
    fs::create_directories(base_dir, ec);
    if (ec) {
        return Result::Fail(ec.value(), "create_directories failed: " + dst_dir + ": " + ec.message());
    }

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail("archive_read_new failed");

    archive_read_support_filter_all(ar.get());
    archive_read_support_format_all(ar.get());

    if (archive_read_open_filename(ar.get(), archive_path.c_str(), 64 * 1024) != ARCHIVE_OK) {
        return Result::Fail("Could not open archive " + archive_path + ": " + ArchiveErr(ar.get()));
    }

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return Result::Fail("archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_PERM;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    archive_entry* entry = nullptr;
    size_t entries = 0;

    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK) {
            return Result::Fail("archive_read_next_header: " + ArchiveErr(ar.get()));
        }

        std::string rel;
        auto path_res = ArchivePathPolicy::Normalize(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return path_res;
        if (rel.empty()) {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        const std::string target_path = (base_dir / fs::path(rel)).string();
        archive_entry_set_pathname(entry, target_path.c_str());

        if (const char* hardlink = archive_entry_hardlink(entry)) {
            std::string rel_hl;
            auto hl_res = ArchivePathPolicy::Normalize(hardlink, rel_hl);
            if (!hl_res.is_ok()) return hl_res;
            if (!rel_hl.empty()) {
                archive_entry_set_hardlink(entry, (base_dir / fs::path(rel_hl)).string().c_str());
            }
        }

        LogDebug("unpack: %s", target_path.c_str());

        if (archive_write_header(aw.get(), entry) != ARCHIVE_OK) {
            return Result::Fail("archive_write_header: " + ArchiveErr(aw.get()));
        }

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK) {
                return Result::Fail("archive_read_data_block: " + ArchiveErr(ar.get()));
            }
            if (archive_write_data_block(aw.get(), buff, size, offset) != ARCHIVE_OK) {
                return Result::Fail("archive_write_data_block: " + ArchiveErr(aw.get()));
            }
        }

        if (archive_write_finish_entry(aw.get()) != ARCHIVE_OK) {
            return Result::Fail("archive_write_finish_entry: " + ArchiveErr(aw.get()));
        }
        ++entries;
    }

    LogInfo("Unpacked %zu entries from %s into %s", entries, archive_path.c_str(), dst_dir.c_str());
    return Result::Ok();
}

} // namespace vfsup
