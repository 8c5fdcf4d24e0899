#include "toolshed/archive.hpp"
#include "toolshed/platform.hpp"
#include "archive_internal.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>
#include <zlib.h>

namespace fs = std::filesystem;

namespace toolshed {

// ============================================================================
// Zip Format Constants (PKWARE APPNOTE, no zip64)
// ============================================================================

static constexpr uint32_t ZIP_LOCAL_HEADER_SIG = 0x04034b50;
static constexpr uint32_t ZIP_CENTRAL_HEADER_SIG = 0x02014b50;
static constexpr uint32_t ZIP_END_OF_CENTRAL_SIG = 0x06054b50;

static constexpr size_t ZIP_LOCAL_HEADER_SIZE = 30;
static constexpr size_t ZIP_CENTRAL_HEADER_SIZE = 46;
static constexpr size_t ZIP_END_OF_CENTRAL_SIZE = 22;
static constexpr size_t ZIP_MAX_COMMENT = 0xFFFF;

static constexpr uint16_t ZIP_METHOD_STORED = 0;
static constexpr uint16_t ZIP_METHOD_DEFLATED = 8;
static constexpr uint16_t ZIP_FLAG_ENCRYPTED = 0x0001;
static constexpr uint16_t ZIP_FLAG_UTF8 = 0x0800;
static constexpr uint16_t ZIP_VERSION_NEEDED = 20;
static constexpr uint16_t ZIP_MADE_BY_UNIX = (3 << 8) | 20;

static constexpr uint32_t UNIX_TYPE_MASK = 0170000;
static constexpr uint32_t UNIX_TYPE_SYMLINK = 0120000;
static constexpr uint32_t UNIX_TYPE_REGULAR = 0100000;

namespace {

uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

void put_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xff));
}

struct CentralEntry {
    std::string name;
    uint16_t flags = 0;
    uint16_t method = 0;
    uint16_t dos_time = 0;
    uint16_t dos_date = 0;
    uint32_t crc = 0;
    uint32_t compressed_size = 0;
    uint32_t uncompressed_size = 0;
    uint16_t made_by = 0;
    uint32_t external_attrs = 0;
    uint32_t local_offset = 0;
};

bool read_at(std::ifstream& file, uint64_t offset, uint8_t* buf, size_t len) {
    file.clear();
    file.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    file.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
    return file.gcount() == static_cast<std::streamsize>(len);
}

bool read_central_directory(std::ifstream& file, uint64_t file_size,
                            std::vector<CentralEntry>& entries, std::string& error) {
    size_t tail_len = static_cast<size_t>(
        std::min<uint64_t>(file_size, ZIP_END_OF_CENTRAL_SIZE + ZIP_MAX_COMMENT));
    if (tail_len < ZIP_END_OF_CENTRAL_SIZE) {
        error = "file too small for a zip archive";
        return false;
    }

    std::vector<uint8_t> tail(tail_len);
    if (!read_at(file, file_size - tail_len, tail.data(), tail_len)) {
        error = "failed to read zip trailer";
        return false;
    }

    size_t eocd = std::string::npos;
    for (size_t i = tail_len - ZIP_END_OF_CENTRAL_SIZE + 1; i-- > 0;) {
        if (read_u32(tail.data() + i) == ZIP_END_OF_CENTRAL_SIG) {
            eocd = i;
            break;
        }
    }
    if (eocd == std::string::npos) {
        error = "end of central directory not found";
        return false;
    }

    const uint8_t* e = tail.data() + eocd;
    uint16_t total_entries = read_u16(e + 10);
    uint32_t cd_size = read_u32(e + 12);
    uint32_t cd_offset = read_u32(e + 16);

    if (total_entries == 0xFFFF || cd_size == 0xFFFFFFFF || cd_offset == 0xFFFFFFFF) {
        error = "zip64 archives are not supported";
        return false;
    }
    if (static_cast<uint64_t>(cd_offset) + cd_size > file_size) {
        error = "central directory lies outside the file";
        return false;
    }

    std::vector<uint8_t> cd(cd_size);
    if (cd_size > 0 && !read_at(file, cd_offset, cd.data(), cd_size)) {
        error = "failed to read central directory";
        return false;
    }

    size_t pos = 0;
    for (uint16_t i = 0; i < total_entries; ++i) {
        if (pos + ZIP_CENTRAL_HEADER_SIZE > cd.size() ||
            read_u32(cd.data() + pos) != ZIP_CENTRAL_HEADER_SIG) {
            error = "malformed central directory entry " + std::to_string(i);
            return false;
        }
        const uint8_t* h = cd.data() + pos;
        CentralEntry entry;
        entry.made_by = read_u16(h + 4);
        entry.flags = read_u16(h + 8);
        entry.method = read_u16(h + 10);
        entry.dos_time = read_u16(h + 12);
        entry.dos_date = read_u16(h + 14);
        entry.crc = read_u32(h + 16);
        entry.compressed_size = read_u32(h + 20);
        entry.uncompressed_size = read_u32(h + 24);
        uint16_t name_len = read_u16(h + 28);
        uint16_t extra_len = read_u16(h + 30);
        uint16_t comment_len = read_u16(h + 32);
        entry.external_attrs = read_u32(h + 38);
        entry.local_offset = read_u32(h + 42);

        size_t record_len = ZIP_CENTRAL_HEADER_SIZE + name_len + extra_len + comment_len;
        if (pos + record_len > cd.size()) {
            error = "truncated central directory entry " + std::to_string(i);
            return false;
        }
        entry.name.assign(reinterpret_cast<const char*>(h + ZIP_CENTRAL_HEADER_SIZE), name_len);
        entries.push_back(std::move(entry));
        pos += record_len;
    }
    return true;
}

// Stream one member's data into out, verifying size and CRC
bool extract_member(std::ifstream& file, uint64_t file_size, const CentralEntry& entry,
                    std::ofstream& out, std::string& error) {
    uint8_t local[ZIP_LOCAL_HEADER_SIZE];
    if (!read_at(file, entry.local_offset, local, sizeof(local)) ||
        read_u32(local) != ZIP_LOCAL_HEADER_SIG) {
        error = "bad local header for " + entry.name;
        return false;
    }

    uint64_t data_offset = static_cast<uint64_t>(entry.local_offset) + ZIP_LOCAL_HEADER_SIZE +
                           read_u16(local + 26) + read_u16(local + 28);
    if (data_offset + entry.compressed_size > file_size) {
        error = "member data lies outside the file: " + entry.name;
        return false;
    }

    file.clear();
    file.seekg(static_cast<std::streamoff>(data_offset), std::ios::beg);

    const size_t CHUNK = 65536;
    std::vector<uint8_t> in_buf(CHUNK);
    std::vector<uint8_t> out_buf(CHUNK);
    uint32_t crc = static_cast<uint32_t>(crc32(0L, Z_NULL, 0));
    uint64_t produced = 0;
    uint64_t remaining = entry.compressed_size;

    if (entry.method == ZIP_METHOD_STORED) {
        while (remaining > 0) {
            size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, CHUNK));
            file.read(reinterpret_cast<char*>(in_buf.data()), static_cast<std::streamsize>(want));
            if (file.gcount() != static_cast<std::streamsize>(want)) {
                error = "short read in " + entry.name;
                return false;
            }
            crc = static_cast<uint32_t>(crc32(crc, in_buf.data(), static_cast<uInt>(want)));
            out.write(reinterpret_cast<const char*>(in_buf.data()), static_cast<std::streamsize>(want));
            produced += want;
            remaining -= want;
        }
    } else {
        z_stream strm;
        std::memset(&strm, 0, sizeof(strm));
        if (inflateInit2(&strm, -MAX_WBITS) != Z_OK) {
            error = "inflateInit2 failed";
            return false;
        }

        int ret = Z_OK;
        while (ret != Z_STREAM_END) {
            if (strm.avail_in == 0) {
                if (remaining == 0) break;
                size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, CHUNK));
                file.read(reinterpret_cast<char*>(in_buf.data()), static_cast<std::streamsize>(want));
                if (file.gcount() != static_cast<std::streamsize>(want)) {
                    inflateEnd(&strm);
                    error = "short read in " + entry.name;
                    return false;
                }
                remaining -= want;
                strm.next_in = in_buf.data();
                strm.avail_in = static_cast<uInt>(want);
            }

            strm.next_out = out_buf.data();
            strm.avail_out = static_cast<uInt>(CHUNK);
            ret = inflate(&strm, Z_NO_FLUSH);
            if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
                inflateEnd(&strm);
                error = "corrupt deflate data in " + entry.name;
                return false;
            }
            size_t have = CHUNK - strm.avail_out;
            crc = static_cast<uint32_t>(crc32(crc, out_buf.data(), static_cast<uInt>(have)));
            out.write(reinterpret_cast<const char*>(out_buf.data()), static_cast<std::streamsize>(have));
            produced += have;
        }
        inflateEnd(&strm);

        if (ret != Z_STREAM_END) {
            error = "truncated deflate data in " + entry.name;
            return false;
        }
    }

    if (!out) {
        error = "failed to write " + entry.name;
        return false;
    }
    if (produced != entry.uncompressed_size || crc != entry.crc) {
        error = "CRC or size mismatch in " + entry.name;
        return false;
    }
    return true;
}

void to_dos_time(fs::file_time_type ft, uint16_t& dos_time, uint16_t& dos_date) {
    auto sys = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ft - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    std::time_t t = std::chrono::system_clock::to_time_t(sys);
    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    int year = tm_buf.tm_year + 1900;
    if (year < 1980) {
        dos_time = 0;
        dos_date = (1 << 5) | 1;  // 1980-01-01
        return;
    }
    dos_time = static_cast<uint16_t>((tm_buf.tm_hour << 11) | (tm_buf.tm_min << 5) | (tm_buf.tm_sec / 2));
    dos_date = static_cast<uint16_t>(((year - 1980) << 9) | ((tm_buf.tm_mon + 1) << 5) | tm_buf.tm_mday);
}

bool deflate_buffer(const std::vector<uint8_t>& data, std::vector<uint8_t>& out) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return false;
    }

    out.resize(deflateBound(&strm, static_cast<uLong>(data.size())));
    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    int ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);
    if (ret != Z_STREAM_END) {
        return false;
    }
    out.resize(strm.total_out);
    return true;
}

} // namespace

ExtractResult extract_zip(const std::string& archive_path, const std::string& dest_dir) {
    ExtractResult result;

    std::ifstream file(archive_path, std::ios::binary);
    if (!file) {
        result.error = "failed to open archive: " + archive_path;
        return result;
    }
    auto size = file_size(archive_path);
    if (!size) {
        result.error = "failed to stat archive: " + archive_path;
        return result;
    }

    std::vector<CentralEntry> entries;
    std::string error;
    if (!read_central_directory(file, *size, entries, error)) {
        result.error = error + ": " + archive_path;
        return result;
    }

    if (!create_directories(dest_dir)) {
        result.error = "failed to create extraction directory: " + dest_dir;
        return result;
    }

    for (const auto& entry : entries) {
        bool unix_attrs = (entry.made_by >> 8) == 3;
        uint32_t mode = unix_attrs ? (entry.external_attrs >> 16) : 0;

        if (unix_attrs && (mode & UNIX_TYPE_MASK) == UNIX_TYPE_SYMLINK) {
            result.error = "symlinks not permitted: " + entry.name;
            return result;
        }
        if (entry.flags & ZIP_FLAG_ENCRYPTED) {
            result.error = "encrypted entries not supported: " + entry.name;
            return result;
        }

        bool is_dir = !entry.name.empty() && (entry.name.back() == '/' || entry.name.back() == '\\');

        auto target = archive_detail::resolve_entry(entry.name, dest_dir);
        if (!target.ok) {
            result.error = target.error;
            return result;
        }

        if (is_dir) {
            if (!create_directories(target.full_path)) {
                result.error = "failed to create directory: " + entry.name;
                return result;
            }
            result.entries.push_back(target.relative);
            continue;
        }

        if (entry.method != ZIP_METHOD_STORED && entry.method != ZIP_METHOD_DEFLATED) {
            result.error = "unsupported compression method " + std::to_string(entry.method) +
                           ": " + entry.name;
            return result;
        }

        std::string parent = get_parent_directory(target.full_path);
        if (!parent.empty() && !create_directories(parent)) {
            result.error = "failed to create parent directory for: " + entry.name;
            return result;
        }

        std::ofstream out(target.full_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            result.error = "failed to create file: " + entry.name;
            return result;
        }
        if (!extract_member(file, *size, entry, out, error)) {
            result.error = error;
            return result;
        }
        out.close();

        // Archives made on Windows carry no mode; treat their files as plain data
        archive_detail::apply_file_mode(target.full_path, unix_attrs ? mode : 0644);
        result.entries.push_back(target.relative);
    }

    result.ok = true;
    return result;
}

ZipWriteResult write_zip_archive(const std::string& base_dir,
                                 const std::vector<std::string>& relative_files,
                                 const std::string& output_path) {
    ZipWriteResult result;

    if (relative_files.size() >= 0xFFFF) {
        result.error = "too many files for a zip archive without zip64";
        return result;
    }

    std::string temp_path = output_path + ".partial";
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        result.error = "failed to create archive: " + temp_path;
        return result;
    }

    std::vector<CentralEntry> central;
    uint64_t offset = 0;

    auto fail = [&](const std::string& message) {
        out.close();
        remove_file(temp_path);
        result.error = message;
        return result;
    };

    for (const auto& rel : relative_files) {
        std::string full = join_path(base_dir, rel);
        std::ifstream in(full, std::ios::binary);
        if (!in) {
            return fail("failed to read " + full);
        }
        std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (data.size() >= 0xFFFFFFFFULL) {
            return fail("file too large for a zip archive without zip64: " + rel);
        }

        CentralEntry entry;
        entry.name = to_portable_path(rel);
        entry.flags = ZIP_FLAG_UTF8;
        entry.crc = static_cast<uint32_t>(crc32(0L, data.data(), static_cast<uInt>(data.size())));
        entry.uncompressed_size = static_cast<uint32_t>(data.size());

        std::error_code ec;
        to_dos_time(fs::last_write_time(full, ec), entry.dos_time, entry.dos_date);
        if (ec) {
            entry.dos_time = 0;
            entry.dos_date = (1 << 5) | 1;
        }

        uint32_t perms = is_executable_file(full) ? 0755 : 0644;
        entry.made_by = ZIP_MADE_BY_UNIX;
        entry.external_attrs = (UNIX_TYPE_REGULAR | perms) << 16;

        std::vector<uint8_t> compressed;
        const std::vector<uint8_t>* payload = &data;
        entry.method = ZIP_METHOD_STORED;
        if (!data.empty() && deflate_buffer(data, compressed) && compressed.size() < data.size()) {
            entry.method = ZIP_METHOD_DEFLATED;
            payload = &compressed;
        }
        entry.compressed_size = static_cast<uint32_t>(payload->size());

        if (offset >= 0xFFFFFFFFULL) {
            return fail("archive exceeds 4 GiB without zip64");
        }
        entry.local_offset = static_cast<uint32_t>(offset);

        std::vector<uint8_t> header;
        put_u32(header, ZIP_LOCAL_HEADER_SIG);
        put_u16(header, ZIP_VERSION_NEEDED);
        put_u16(header, entry.flags);
        put_u16(header, entry.method);
        put_u16(header, entry.dos_time);
        put_u16(header, entry.dos_date);
        put_u32(header, entry.crc);
        put_u32(header, entry.compressed_size);
        put_u32(header, entry.uncompressed_size);
        put_u16(header, static_cast<uint16_t>(entry.name.size()));
        put_u16(header, 0);
        header.insert(header.end(), entry.name.begin(), entry.name.end());

        out.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));
        out.write(reinterpret_cast<const char*>(payload->data()), static_cast<std::streamsize>(payload->size()));
        if (!out) {
            return fail("failed to write archive: " + temp_path);
        }

        offset += header.size() + payload->size();
        central.push_back(std::move(entry));
    }

    if (offset >= 0xFFFFFFFFULL) {
        return fail("archive exceeds 4 GiB without zip64");
    }

    std::vector<uint8_t> cd;
    for (const auto& entry : central) {
        put_u32(cd, ZIP_CENTRAL_HEADER_SIG);
        put_u16(cd, entry.made_by);
        put_u16(cd, ZIP_VERSION_NEEDED);
        put_u16(cd, entry.flags);
        put_u16(cd, entry.method);
        put_u16(cd, entry.dos_time);
        put_u16(cd, entry.dos_date);
        put_u32(cd, entry.crc);
        put_u32(cd, entry.compressed_size);
        put_u32(cd, entry.uncompressed_size);
        put_u16(cd, static_cast<uint16_t>(entry.name.size()));
        put_u16(cd, 0);  // extra
        put_u16(cd, 0);  // comment
        put_u16(cd, 0);  // disk number
        put_u16(cd, 0);  // internal attrs
        put_u32(cd, entry.external_attrs);
        put_u32(cd, entry.local_offset);
        cd.insert(cd.end(), entry.name.begin(), entry.name.end());
    }

    std::vector<uint8_t> eocd;
    put_u32(eocd, ZIP_END_OF_CENTRAL_SIG);
    put_u16(eocd, 0);
    put_u16(eocd, 0);
    put_u16(eocd, static_cast<uint16_t>(central.size()));
    put_u16(eocd, static_cast<uint16_t>(central.size()));
    put_u32(eocd, static_cast<uint32_t>(cd.size()));
    put_u32(eocd, static_cast<uint32_t>(offset));
    put_u16(eocd, 0);

    out.write(reinterpret_cast<const char*>(cd.data()), static_cast<std::streamsize>(cd.size()));
    out.write(reinterpret_cast<const char*>(eocd.data()), static_cast<std::streamsize>(eocd.size()));
    out.close();
    if (!out) {
        remove_file(temp_path);
        result.error = "failed to finish archive: " + temp_path;
        return result;
    }

    std::error_code ec;
    fs::rename(temp_path, output_path, ec);
    if (ec) {
        remove_file(temp_path);
        result.error = "failed to move archive into place: " + ec.message();
        return result;
    }

    result.ok = true;
    result.entry_count = central.size();
    result.archive_size = offset + cd.size() + eocd.size();
    spdlog::debug("wrote {} ({} entries, {} bytes)", output_path, result.entry_count, result.archive_size);
    return result;
}

} // namespace toolshed
