#include "../include/archive.hpp"
#include <zlib.h>
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace {
struct Entry {
    std::string name; // '/'-separated; directories end with '/'
    fs::path path;
    bool dir{false};
};

// Entries carry a fixed timestamp so archives of identical trees are identical.
constexpr uint16_t kDosTime = 0;
constexpr uint16_t kDosDate = (0 << 9) | (1 << 5) | 1; // 1980-01-01
constexpr uint64_t kZipLimit = 0xFFFFFFFFull;
constexpr std::size_t kBlock = 512;

std::string read_file(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("cannot read " + p.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void write_file(const fs::path& p, const char* data, std::size_t size) {
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    if (!f) throw std::runtime_error("cannot write " + p.string());
    f.write(data, static_cast<std::streamsize>(size));
    if (!f) throw std::runtime_error("write failed: " + p.string());
}

std::vector<Entry> collect_entries(const fs::path& source) {
    std::vector<Entry> out;
    if (!fs::is_directory(source)) {
        out.push_back({source.filename().generic_string(), source, false});
        return out;
    }
    for (auto& e : fs::recursive_directory_iterator(source)) {
        std::string rel = fs::relative(e.path(), source).generic_string();
        if (e.is_directory()) {
            out.push_back({rel + "/", e.path(), true});
        } else if (e.is_regular_file()) {
            out.push_back({rel, e.path(), false});
        }
    }
    std::sort(out.begin(), out.end(), [](const Entry& a, const Entry& b){ return a.name < b.name; });
    return out;
}

fs::path safe_target(const fs::path& dest, const std::string& name) {
    fs::path rel(name);
    if (name.empty() || rel.has_root_name() || rel.has_root_directory()) {
        throw std::runtime_error("unsafe archive entry: " + name);
    }
    for (const auto& part : rel) {
        if (part == "..") throw std::runtime_error("unsafe archive entry: " + name);
    }
    return dest / rel;
}

// ---- zip ----

void put16(std::string& b, uint16_t v) {
    b.push_back(static_cast<char>(v & 0xFF));
    b.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void put32(std::string& b, uint32_t v) {
    put16(b, static_cast<uint16_t>(v & 0xFFFF));
    put16(b, static_cast<uint16_t>((v >> 16) & 0xFFFF));
}

uint16_t get16(const std::string& b, std::size_t off) {
    if (off + 2 > b.size()) throw std::runtime_error("zip: truncated archive");
    return static_cast<uint16_t>(static_cast<unsigned char>(b[off]) |
                                 (static_cast<unsigned char>(b[off + 1]) << 8));
}

uint32_t get32(const std::string& b, std::size_t off) {
    return static_cast<uint32_t>(get16(b, off)) | (static_cast<uint32_t>(get16(b, off + 2)) << 16);
}

std::string deflate_raw(const std::string& in) {
    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("zip: deflateInit2 failed");
    }
    std::string out(deflateBound(&zs, static_cast<uLong>(in.size())), '\0');
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());
    int rc = deflate(&zs, Z_FINISH);
    uLong produced = zs.total_out;
    deflateEnd(&zs);
    if (rc != Z_STREAM_END) throw std::runtime_error("zip: deflate failed");
    out.resize(produced);
    return out;
}

std::string inflate_raw(const char* data, std::size_t size, std::size_t expected) {
    z_stream zs{};
    if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) throw std::runtime_error("unzip: inflateInit2 failed");
    std::string out(expected, '\0');
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
    zs.avail_in = static_cast<uInt>(size);
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());
    int rc = inflate(&zs, Z_FINISH);
    uLong produced = zs.total_out;
    inflateEnd(&zs);
    if (rc != Z_STREAM_END || produced != expected) throw std::runtime_error("unzip: corrupt deflate stream");
    return out;
}

void write_zip(const std::vector<Entry>& entries, const fs::path& archive) {
    if (entries.size() > 0xFFFF) throw std::runtime_error("zip: too many entries");
    std::ofstream out(archive, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("cannot write " + archive.string());

    std::string central;
    uint64_t offset = 0;
    for (const auto& e : entries) {
        std::string data = e.dir ? std::string() : read_file(e.path);
        uint32_t crc = static_cast<uint32_t>(crc32(0L, reinterpret_cast<const Bytef*>(data.data()),
                                                   static_cast<uInt>(data.size())));
        std::string packed = e.dir ? std::string() : deflate_raw(data);
        uint16_t method = 8;
        if (packed.size() >= data.size()) {
            packed = data;
            method = 0;
        }
        if (data.size() > kZipLimit || offset > kZipLimit) throw std::runtime_error("zip: archive too large");

        std::string local;
        put32(local, 0x04034b50);
        put16(local, 20);
        put16(local, 0x0800);
        put16(local, method);
        put16(local, kDosTime);
        put16(local, kDosDate);
        put32(local, crc);
        put32(local, static_cast<uint32_t>(packed.size()));
        put32(local, static_cast<uint32_t>(data.size()));
        put16(local, static_cast<uint16_t>(e.name.size()));
        put16(local, 0);
        local += e.name;

        put32(central, 0x02014b50);
        put16(central, 0x031E);
        put16(central, 20);
        put16(central, 0x0800);
        put16(central, method);
        put16(central, kDosTime);
        put16(central, kDosDate);
        put32(central, crc);
        put32(central, static_cast<uint32_t>(packed.size()));
        put32(central, static_cast<uint32_t>(data.size()));
        put16(central, static_cast<uint16_t>(e.name.size()));
        put16(central, 0);
        put16(central, 0);
        put16(central, 0);
        put16(central, 0);
        put32(central, e.dir ? ((040755u << 16) | 0x10) : (0100644u << 16));
        put32(central, static_cast<uint32_t>(offset));
        central += e.name;

        out.write(local.data(), static_cast<std::streamsize>(local.size()));
        out.write(packed.data(), static_cast<std::streamsize>(packed.size()));
        offset += local.size() + packed.size();
    }
    if (offset > kZipLimit) throw std::runtime_error("zip: archive too large");

    std::string end;
    put32(end, 0x06054b50);
    put16(end, 0);
    put16(end, 0);
    put16(end, static_cast<uint16_t>(entries.size()));
    put16(end, static_cast<uint16_t>(entries.size()));
    put32(end, static_cast<uint32_t>(central.size()));
    put32(end, static_cast<uint32_t>(offset));
    put16(end, 0);
    out.write(central.data(), static_cast<std::streamsize>(central.size()));
    out.write(end.data(), static_cast<std::streamsize>(end.size()));
    if (!out) throw std::runtime_error("write failed: " + archive.string());
}

void read_zip(const fs::path& archive, const fs::path& dest) {
    std::string b = read_file(archive);
    if (b.size() < 22) throw std::runtime_error("unzip: not a zip archive: " + archive.string());

    std::size_t eocd = std::string::npos;
    std::size_t lowest = b.size() > 22 + 0xFFFF ? b.size() - 22 - 0xFFFF : 0;
    for (std::size_t pos = b.size() - 22 + 1; pos-- > lowest;) {
        if (get32(b, pos) == 0x06054b50) { eocd = pos; break; }
    }
    if (eocd == std::string::npos) throw std::runtime_error("unzip: missing end of central directory");

    uint16_t count = get16(b, eocd + 10);
    std::size_t pos = get32(b, eocd + 16);
    fs::create_directories(dest);
    for (uint16_t i = 0; i < count; ++i) {
        if (get32(b, pos) != 0x02014b50) throw std::runtime_error("unzip: bad central directory entry");
        uint16_t flags = get16(b, pos + 8);
        uint16_t method = get16(b, pos + 10);
        uint32_t crc = get32(b, pos + 16);
        uint32_t csize = get32(b, pos + 20);
        uint32_t usize = get32(b, pos + 24);
        uint16_t name_len = get16(b, pos + 28);
        uint16_t extra_len = get16(b, pos + 30);
        uint16_t comment_len = get16(b, pos + 32);
        uint32_t local = get32(b, pos + 42);
        if (pos + 46 + name_len > b.size()) throw std::runtime_error("zip: truncated archive");
        std::string name = b.substr(pos + 46, name_len);
        pos += 46 + name_len + extra_len + comment_len;

        if (flags & 0x1) throw std::runtime_error("unzip: encrypted entry not supported: " + name);
        fs::path target = safe_target(dest, name);
        if (!name.empty() && name.back() == '/') {
            fs::create_directories(target);
            continue;
        }

        if (get32(b, local) != 0x04034b50) throw std::runtime_error("unzip: bad local header for " + name);
        std::size_t data = local + 30 + get16(b, local + 26) + get16(b, local + 28);
        if (data + csize > b.size()) throw std::runtime_error("zip: truncated archive");

        std::string content;
        if (method == 0) {
            content = b.substr(data, csize);
        } else if (method == 8) {
            content = inflate_raw(b.data() + data, csize, usize);
        } else {
            throw std::runtime_error("unzip: unsupported compression method " + std::to_string(method));
        }
        uint32_t actual = static_cast<uint32_t>(crc32(0L, reinterpret_cast<const Bytef*>(content.data()),
                                                      static_cast<uInt>(content.size())));
        if (actual != crc) throw std::runtime_error("unzip: checksum mismatch for " + name);
        if (target.has_parent_path()) fs::create_directories(target.parent_path());
        write_file(target, content.data(), content.size());
    }
}

// ---- tar / tgz ----

class GzFile {
public:
    GzFile(const fs::path& p, const char* mode) : f_(gzopen(p.string().c_str(), mode)) {
        if (!f_) throw std::runtime_error("cannot open " + p.string());
    }
    ~GzFile() { if (f_) gzclose(f_); }
    GzFile(const GzFile&) = delete;
    GzFile& operator=(const GzFile&) = delete;

    void write(const char* data, std::size_t size) {
        while (size > 0) {
            unsigned chunk = static_cast<unsigned>(std::min<std::size_t>(size, 1u << 20));
            if (gzwrite(f_, data, chunk) != static_cast<int>(chunk)) throw std::runtime_error("tar: write failed");
            data += chunk;
            size -= chunk;
        }
    }

    // Returns false on clean end of stream; throws on a short read.
    bool read(char* data, std::size_t size) {
        std::size_t got = 0;
        while (got < size) {
            int n = gzread(f_, data + got, static_cast<unsigned>(std::min<std::size_t>(size - got, 1u << 20)));
            if (n < 0) throw std::runtime_error("tar: read failed");
            if (n == 0) break;
            got += static_cast<std::size_t>(n);
        }
        if (got == 0) return false;
        if (got < size) throw std::runtime_error("tar: truncated archive");
        return true;
    }

    void close() {
        int rc = gzclose(f_);
        f_ = nullptr;
        if (rc != Z_OK) throw std::runtime_error("tar: close failed");
    }

private:
    gzFile f_;
};

void put_octal(char* field, std::size_t width, uint64_t v) {
    std::snprintf(field, width, "%0*llo", static_cast<int>(width - 1), static_cast<unsigned long long>(v));
}

uint64_t get_octal(const char* field, std::size_t width) {
    uint64_t v = 0;
    for (std::size_t i = 0; i < width; ++i) {
        char c = field[i];
        if (c == ' ' && v == 0) continue;
        if (c < '0' || c > '7') break;
        v = v * 8 + static_cast<uint64_t>(c - '0');
    }
    return v;
}

unsigned header_checksum(const char* h) {
    unsigned sum = 0;
    for (std::size_t i = 0; i < kBlock; ++i) {
        bool in_field = i >= 148 && i < 156;
        sum += in_field ? static_cast<unsigned>(' ') : static_cast<unsigned char>(h[i]);
    }
    return sum;
}

void set_tar_name(char* h, const std::string& name) {
    if (name.size() <= 100) {
        std::memcpy(h, name.data(), name.size());
        return;
    }
    for (std::size_t cut = name.find('/'); cut != std::string::npos; cut = name.find('/', cut + 1)) {
        if (cut <= 155 && name.size() - cut - 1 <= 100 && name.size() - cut - 1 > 0) {
            std::memcpy(h + 345, name.data(), cut);
            std::memcpy(h, name.data() + cut + 1, name.size() - cut - 1);
            return;
        }
    }
    throw std::runtime_error("tar: entry name too long: " + name);
}

void write_tar(const std::vector<Entry>& entries, const fs::path& archive, bool gzip) {
    GzFile out(archive, gzip ? "wb" : "wbT");
    const char zeros[kBlock] = {};
    for (const auto& e : entries) {
        std::string data = e.dir ? std::string() : read_file(e.path);
        if (data.size() >= (1ull << 33)) throw std::runtime_error("tar: file too large: " + e.name);
        char h[kBlock] = {};
        set_tar_name(h, e.name);
        put_octal(h + 100, 8, e.dir ? 0755 : 0644);
        put_octal(h + 108, 8, 0);
        put_octal(h + 116, 8, 0);
        put_octal(h + 124, 12, data.size());
        put_octal(h + 136, 12, 0);
        h[156] = e.dir ? '5' : '0';
        std::memcpy(h + 257, "ustar", 6);
        std::memcpy(h + 263, "00", 2);
        std::snprintf(h + 148, 8, "%06o", header_checksum(h));
        h[155] = ' ';
        out.write(h, kBlock);
        out.write(data.data(), data.size());
        if (data.size() % kBlock) out.write(zeros, kBlock - data.size() % kBlock);
    }
    out.write(zeros, kBlock);
    out.write(zeros, kBlock);
    out.close();
}

void read_tar(const fs::path& archive, const fs::path& dest) {
    GzFile in(archive, "rb");
    fs::create_directories(dest);
    char h[kBlock];
    std::vector<char> buf;
    while (in.read(h, kBlock)) {
        if (std::all_of(h, h + kBlock, [](char c){ return c == 0; })) break;
        if (get_octal(h + 148, 8) != header_checksum(h)) throw std::runtime_error("tar: header checksum mismatch");

        std::string name(h, strnlen(h, 100));
        if (std::memcmp(h + 257, "ustar", 5) == 0 && h[345] != 0) {
            name = std::string(h + 345, strnlen(h + 345, 155)) + "/" + name;
        }
        uint64_t size = get_octal(h + 124, 12);
        uint64_t padded = (size + kBlock - 1) / kBlock * kBlock;
        char type = h[156];

        if (type == '5') {
            fs::create_directories(safe_target(dest, name));
        }
        if (type == '0' || type == '\0') {
            fs::path target = safe_target(dest, name);
            if (target.has_parent_path()) fs::create_directories(target.parent_path());
            buf.resize(padded);
            if (padded > 0 && !in.read(buf.data(), padded)) throw std::runtime_error("tar: truncated archive");
            write_file(target, buf.data(), size);
            continue;
        }
        // Directories, links and extension headers: skip any payload.
        buf.resize(padded);
        if (padded > 0 && !in.read(buf.data(), padded)) throw std::runtime_error("tar: truncated archive");
    }
}
}

ArchiveType parse_archive_type(const std::string& name) {
    if (name == "zip") return ArchiveType::Zip;
    if (name == "tar") return ArchiveType::Tar;
    if (name == "tgz" || name == "tar.gz") return ArchiveType::Tgz;
    throw std::runtime_error("unknown archive type: " + name);
}

ArchiveType archive_type_for(const fs::path& p) {
    std::string name = p.filename().string();
    auto ends_with = [&](const std::string& suffix) {
        return name.size() >= suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    if (ends_with(".tar.gz") || ends_with(".tgz")) return ArchiveType::Tgz;
    if (ends_with(".tar")) return ArchiveType::Tar;
    return ArchiveType::Zip;
}

void create_archive(const fs::path& source, const fs::path& archive, ArchiveType type) {
    auto entries = collect_entries(source);
    switch (type) {
        case ArchiveType::Zip: write_zip(entries, archive); break;
        case ArchiveType::Tar: write_tar(entries, archive, false); break;
        case ArchiveType::Tgz: write_tar(entries, archive, true); break;
    }
}

void extract_archive(const fs::path& archive, const fs::path& dest, ArchiveType type) {
    switch (type) {
        case ArchiveType::Zip: read_zip(archive, dest); break;
        case ArchiveType::Tar:
        case ArchiveType::Tgz: read_tar(archive, dest); break;
    }
}
