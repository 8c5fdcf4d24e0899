#include "toolshed/archive.hpp"
#include "toolshed/platform.hpp"
#include "archive_internal.hpp"

#include <cstdint>
#include <cstring>
#include <fstream>
#include <optional>
#include <vector>
#include <zlib.h>

namespace toolshed {

// ============================================================================
// Tar Format Constants (POSIX ustar)
// ============================================================================

static constexpr size_t TAR_BLOCK_SIZE = 512;
static constexpr size_t TAR_NAME_SIZE = 100;
static constexpr size_t TAR_MODE_SIZE = 8;
static constexpr size_t TAR_SIZE_SIZE = 12;
static constexpr size_t TAR_PREFIX_SIZE = 155;

static constexpr char TAR_REGTYPE = '0';
static constexpr char TAR_AREGTYPE = '\0';
static constexpr char TAR_LNKTYPE = '1';
static constexpr char TAR_SYMTYPE = '2';
static constexpr char TAR_CONTTYPE = '7';
static constexpr char TAR_DIRTYPE = '5';
static constexpr char TAR_GNU_LONGNAME = 'L';
static constexpr char TAR_PAX_HEADER = 'x';
static constexpr char TAR_PAX_GLOBAL = 'g';

#pragma pack(push, 1)
struct TarHeader {
    char name[TAR_NAME_SIZE];       // 0
    char mode[TAR_MODE_SIZE];       // 100
    char uid[8];                    // 108
    char gid[8];                    // 116
    char size[TAR_SIZE_SIZE];       // 124
    char mtime[12];                 // 136
    char chksum[8];                 // 148
    char typeflag;                  // 156
    char linkname[100];             // 157
    char magic[6];                  // 257
    char version[2];                // 263
    char uname[32];                 // 265
    char gname[32];                 // 297
    char devmajor[8];               // 329
    char devminor[8];               // 337
    char prefix[TAR_PREFIX_SIZE];   // 345
    char padding[12];               // 500
};
#pragma pack(pop)

static_assert(sizeof(TarHeader) == TAR_BLOCK_SIZE, "TarHeader must be 512 bytes");

namespace {

uint64_t parse_octal(const char* data, size_t size) {
    uint64_t result = 0;
    size_t i = 0;
    while (i < size && data[i] == ' ') ++i;
    for (; i < size && data[i] != '\0' && data[i] != ' '; ++i) {
        if (data[i] >= '0' && data[i] <= '7') {
            result = (result << 3) | static_cast<uint64_t>(data[i] - '0');
        }
    }
    return result;
}

bool is_zero_block(const uint8_t* block) {
    for (size_t i = 0; i < TAR_BLOCK_SIZE; ++i) {
        if (block[i] != 0) return false;
    }
    return true;
}

// 16 + MAX_WBITS lets zlib parse the gzip wrapper itself
std::optional<std::vector<uint8_t>> gzip_decompress_file(const std::string& path, std::string& error) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        error = "failed to open archive: " + path;
        return std::nullopt;
    }

    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    if (inflateInit2(&stream, 16 + MAX_WBITS) != Z_OK) {
        error = "inflateInit2 failed";
        return std::nullopt;
    }

    std::vector<uint8_t> out;
    const size_t CHUNK = 65536;
    std::vector<uint8_t> in_buf(CHUNK);
    std::vector<uint8_t> out_buf(CHUNK);

    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        file.read(reinterpret_cast<char*>(in_buf.data()), static_cast<std::streamsize>(CHUNK));
        std::streamsize got = file.gcount();
        if (got <= 0) break;

        stream.next_in = in_buf.data();
        stream.avail_in = static_cast<uInt>(got);

        do {
            stream.next_out = out_buf.data();
            stream.avail_out = static_cast<uInt>(CHUNK);
            ret = inflate(&stream, Z_NO_FLUSH);
            if (ret == Z_STREAM_ERROR || ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR) {
                inflateEnd(&stream);
                error = "corrupt gzip stream: " + path;
                return std::nullopt;
            }
            size_t have = CHUNK - stream.avail_out;
            out.insert(out.end(), out_buf.begin(), out_buf.begin() + static_cast<std::ptrdiff_t>(have));
        } while (stream.avail_out == 0 && ret != Z_STREAM_END);
    }

    inflateEnd(&stream);

    if (ret != Z_STREAM_END) {
        error = "truncated gzip stream: " + path;
        return std::nullopt;
    }
    return out;
}

// Reads the "path" record of a pax extended header into path. Each record is
// "<len> <key>=<value>\n" where len counts the whole record. False when a
// record is malformed.
bool parse_pax_path(const uint8_t* data, size_t size, std::optional<std::string>& path) {
    size_t pos = 0;
    while (pos < size) {
        size_t space = pos;
        while (space < size && data[space] != ' ') ++space;
        if (space >= size || space == pos) return false;

        size_t len = 0;
        for (size_t i = pos; i < space; ++i) {
            if (data[i] < '0' || data[i] > '9') return false;
            len = len * 10 + static_cast<size_t>(data[i] - '0');
            if (len > size) return false;
        }
        size_t prefix = space - pos + 1;
        if (len <= prefix || pos + len > size || data[pos + len - 1] != '\n') return false;

        std::string record(reinterpret_cast<const char*>(data) + space + 1, len - prefix - 1);
        if (record.rfind("path=", 0) == 0) {
            path = record.substr(5);
        }
        pos += len;
    }
    return true;
}

} // namespace

ExtractResult extract_tar_gz(const std::string& archive_path, const std::string& dest_dir) {
    ExtractResult result;

    std::string error;
    auto tar = gzip_decompress_file(archive_path, error);
    if (!tar) {
        result.error = error;
        return result;
    }
    const std::vector<uint8_t>& tar_data = *tar;

    if (!create_directories(dest_dir)) {
        result.error = "failed to create extraction directory: " + dest_dir;
        return result;
    }

    std::optional<std::string> pending_name;
    size_t offset = 0;

    while (offset + TAR_BLOCK_SIZE <= tar_data.size()) {
        const uint8_t* block = tar_data.data() + offset;
        if (is_zero_block(block)) break;

        const TarHeader* header = reinterpret_cast<const TarHeader*>(block);
        char typeflag = header->typeflag;
        uint64_t size = parse_octal(header->size, TAR_SIZE_SIZE);
        uint64_t mode = parse_octal(header->mode, TAR_MODE_SIZE);

        offset += TAR_BLOCK_SIZE;
        if (offset + size > tar_data.size()) {
            result.error = "truncated archive: " + archive_path;
            return result;
        }
        const uint8_t* payload = tar_data.data() + offset;
        size_t blocks = (size + TAR_BLOCK_SIZE - 1) / TAR_BLOCK_SIZE;
        size_t next = offset + blocks * TAR_BLOCK_SIZE;

        if (typeflag == TAR_GNU_LONGNAME) {
            std::string name(reinterpret_cast<const char*>(payload), size);
            pending_name = std::string(name.c_str());
            offset = next;
            continue;
        }
        if (typeflag == TAR_PAX_HEADER) {
            if (!parse_pax_path(payload, size, pending_name)) {
                result.error = "malformed pax header: " + archive_path;
                return result;
            }
            offset = next;
            continue;
        }
        if (typeflag == TAR_PAX_GLOBAL) {
            offset = next;
            continue;
        }

        std::string path;
        if (pending_name) {
            path = *pending_name;
            pending_name.reset();
        } else {
            if (header->prefix[0] != '\0') {
                path = std::string(header->prefix, strnlen(header->prefix, TAR_PREFIX_SIZE));
                path += '/';
            }
            path += std::string(header->name, strnlen(header->name, TAR_NAME_SIZE));
        }

        // The archive root itself ("./") carries nothing to extract
        if (path == "." || path == "./") {
            offset = next;
            continue;
        }

        if (typeflag == TAR_SYMTYPE || typeflag == TAR_LNKTYPE) {
            result.error = "symlinks and hardlinks not permitted: " + path;
            return result;
        }

        bool is_file = typeflag == TAR_REGTYPE || typeflag == TAR_AREGTYPE || typeflag == TAR_CONTTYPE;
        if (!is_file && typeflag != TAR_DIRTYPE) {
            result.error = "unsupported entry type: " + path;
            return result;
        }

        auto target = archive_detail::resolve_entry(path, dest_dir);
        if (!target.ok) {
            result.error = target.error;
            return result;
        }

        if (typeflag == TAR_DIRTYPE) {
            if (!create_directories(target.full_path)) {
                result.error = "failed to create directory: " + path;
                return result;
            }
        } else {
            std::string parent = get_parent_directory(target.full_path);
            if (!parent.empty() && !create_directories(parent)) {
                result.error = "failed to create parent directory for: " + path;
                return result;
            }

            std::ofstream file(target.full_path, std::ios::binary | std::ios::trunc);
            if (!file) {
                result.error = "failed to create file: " + path;
                return result;
            }
            file.write(reinterpret_cast<const char*>(payload), static_cast<std::streamsize>(size));
            file.close();
            if (!file) {
                result.error = "failed to write file: " + path;
                return result;
            }

            archive_detail::apply_file_mode(target.full_path, static_cast<uint32_t>(mode));
        }

        result.entries.push_back(target.relative);
        offset = next;
    }

    result.ok = true;
    return result;
}

} // namespace toolshed
