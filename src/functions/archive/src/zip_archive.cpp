#include <zip.h>
#include "zip_archive.hpp"
#include "functions/filesystem/src/file_error.hpp"
#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace epubkit {

// unix st_mode (external attributes 상위 16비트)
static constexpr zip_uint32_t kUnixTypeMask = 0170000;
static constexpr zip_uint32_t kUnixSymlink = 0120000;

static std::string error_message(zip_error_t* error) {
    std::string msg = zip_error_strerror(error);
    zip_error_fini(error);
    return msg;
}

// ---- zip에서 엔트리 읽기 ----
static std::string read_zip_entry(zip_t* z, zip_uint64_t index, const std::string& name) {
    zip_stat_t st;
    if (zip_stat_index(z, index, 0, &st) != 0)
        throw std::runtime_error("zip_stat failed: " + name);

    zip_file_t* f = zip_fopen_index(z, index, 0);
    if (!f)
        throw std::runtime_error("zip_fopen failed: " + name);

    std::string buf;
    buf.resize(static_cast<size_t>(st.size));
    zip_int64_t n = st.size == 0 ? 0 : zip_fread(f, buf.data(), st.size);
    zip_fclose(f);

    if (n < 0 || n != static_cast<zip_int64_t>(st.size))
        throw std::runtime_error("zip_fread incomplete: " + name);
    return buf;
}

static bool is_symlink(zip_t* z, zip_uint64_t index) {
    zip_uint8_t opsys = 0;
    zip_uint32_t attributes = 0;
    if (zip_file_get_external_attributes(z, index, 0, &opsys, &attributes) != 0) return false;
    if (opsys != ZIP_OPSYS_UNIX) return false;
    return ((attributes >> 16) & kUnixTypeMask) == kUnixSymlink;
}

static std::vector<ZipEntry> read_all_entries(zip_t* z) {
    std::vector<ZipEntry> entries;
    zip_int64_t count = zip_get_num_entries(z, 0);
    for (zip_int64_t i = 0; i < count; ++i) {
        zip_uint64_t index = static_cast<zip_uint64_t>(i);
        zip_stat_t st;
        if (zip_stat_index(z, index, 0, &st) != 0 || !(st.valid & ZIP_STAT_NAME))
            throw std::runtime_error("zip_stat failed for entry #" + std::to_string(i));

        ZipEntry entry;
        entry.name = st.name;
        if (is_symlink(z, index)) throw SymbolicLinkError(entry.name);
        entry.directory = !entry.name.empty() && entry.name.back() == '/';
        if (st.valid & ZIP_STAT_MTIME) entry.modified = st.mtime;
        if (!entry.directory) entry.data = read_zip_entry(z, index, entry.name);
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::vector<ZipEntry> read_zip_file(const std::filesystem::path& path) {
    int errcode = 0;
    zip_t* z = zip_open(path.string().c_str(), ZIP_RDONLY, &errcode);
    if (!z) {
        zip_error_t ze;
        zip_error_init_with_code(&ze, errcode);
        throw std::runtime_error("zip_open failed: " + error_message(&ze));
    }

    try {
        std::vector<ZipEntry> entries = read_all_entries(z);
        zip_discard(z);
        return entries;
    } catch (const std::exception&) {
        zip_discard(z);
        throw;
    }
}

std::vector<ZipEntry> read_zip_bytes(const std::string& bytes) {
    zip_error_t error;
    zip_error_init(&error);
    zip_source_t* src = zip_source_buffer_create(bytes.data(), bytes.size(), 0, &error);
    if (!src) throw std::runtime_error("zip_source_buffer_create failed: " + error_message(&error));

    zip_t* z = zip_open_from_source(src, ZIP_RDONLY, &error);
    if (!z) {
        zip_source_free(src);
        throw std::runtime_error("zip_open failed: " + error_message(&error));
    }
    zip_error_fini(&error);

    try {
        std::vector<ZipEntry> entries = read_all_entries(z);
        zip_discard(z);
        return entries;
    } catch (const std::exception&) {
        zip_discard(z);
        throw;
    }
}

// ---- zip 쓰기 ----
static void add_entry(zip_t* z, const ZipEntry& entry) {
    zip_int64_t index = -1;
    if (entry.directory) {
        std::string name = entry.name;
        while (!name.empty() && name.back() == '/') name.pop_back();
        index = zip_dir_add(z, name.c_str(), ZIP_FL_ENC_UTF_8);
    } else {
        zip_source_t* s = zip_source_buffer(z, entry.data.data(), entry.data.size(), 0);
        if (!s) throw std::runtime_error("zip_source_buffer failed: " + entry.name);
        index = zip_file_add(z, entry.name.c_str(), s, ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8);
        if (index < 0) zip_source_free(s);
    }
    if (index < 0)
        throw std::runtime_error("zip_add failed: " + entry.name + ": " + zip_strerror(z));

    zip_uint64_t idx = static_cast<zip_uint64_t>(index);
    if (entry.name == "mimetype" && zip_set_file_compression(z, idx, ZIP_CM_STORE, 0) != 0)
        throw std::runtime_error("failed to store mimetype uncompressed: " + std::string(zip_strerror(z)));
    if (entry.modified != 0 && zip_file_set_mtime(z, idx, entry.modified, 0) != 0)
        throw std::runtime_error("zip_file_set_mtime failed: " + entry.name);
}

std::string write_zip_bytes(const std::vector<ZipEntry>& entries) {
    zip_error_t error;
    zip_error_init(&error);
    zip_source_t* src = zip_source_buffer_create(nullptr, 0, 0, &error);
    if (!src) throw std::runtime_error("zip_source_buffer_create failed: " + error_message(&error));

    zip_t* z = zip_open_from_source(src, ZIP_TRUNCATE, &error);
    if (!z) {
        zip_source_free(src);
        throw std::runtime_error("zip_open failed: " + error_message(&error));
    }
    zip_error_fini(&error);
    // zip_close 뒤에도 결과 버퍼를 읽어야 하므로 참조 유지
    zip_source_keep(src);

    try {
        for (const auto& entry : entries) add_entry(z, entry);
    } catch (const std::exception&) {
        zip_discard(z);
        zip_source_free(src);
        throw;
    }

    if (zip_close(z) != 0) {
        std::string msg = zip_strerror(z);
        zip_discard(z);
        zip_source_free(src);
        throw std::runtime_error("zip_close failed: " + msg);
    }

    std::string out;
    if (zip_source_open(src) != 0) {
        zip_source_free(src);
        throw std::runtime_error("failed to reopen archive buffer");
    }
    zip_source_seek(src, 0, SEEK_END);
    zip_int64_t size = zip_source_tell(src);
    zip_source_seek(src, 0, SEEK_SET);
    if (size > 0) {
        out.resize(static_cast<size_t>(size));
        zip_int64_t n = zip_source_read(src, out.data(), static_cast<zip_uint64_t>(size));
        if (n != size) {
            zip_source_close(src);
            zip_source_free(src);
            throw std::runtime_error("failed to read archive buffer");
        }
    }
    zip_source_close(src);
    zip_source_free(src);
    return out;
}

void write_zip_file(const std::filesystem::path& path, const std::vector<ZipEntry>& entries) {
    std::string bytes = write_zip_bytes(entries);
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) throw std::runtime_error("failed to create: " + path.string());
    ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!ofs) throw std::runtime_error("failed to write: " + path.string());
}

} // namespace epubkit
