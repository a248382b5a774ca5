#include "template_file.h"
#include <cstdio>
#include <cstring>
#include <limits>
#include <utility>
#include <vector>

namespace wakematch {

namespace {

void put_u32(unsigned char* p, uint32_t v)
{
    p[0] = v & 0xff;  p[1] = (v >> 8) & 0xff;
    p[2] = (v >> 16) & 0xff;  p[3] = (v >> 24) & 0xff;
}

uint32_t get_u32(const unsigned char* p)
{
    return uint32_t(p[0]) | (uint32_t(p[1]) << 8) |
           (uint32_t(p[2]) << 16) | (uint32_t(p[3]) << 24);
}

/* RAII FILE* – closes on every early return */
struct File {
    explicit File(std::FILE* f) : f(f) {}
    ~File() { if (f) std::fclose(f); }
    File(const File&) = delete;
    File& operator=(const File&) = delete;
    std::FILE* f;
};

} // namespace

bool save_template(const char* path, const FeatureMatrix& tmpl)
{
    File file(std::fopen(path, "wb"));
    if (!file.f) { std::perror(path); return false; }

    unsigned char hdr[16];
    std::memcpy(hdr, kTemplateMagic, 4);
    put_u32(hdr + 4,  kTemplateVersion);
    put_u32(hdr + 8,  static_cast<uint32_t>(tmpl.rows()));
    put_u32(hdr + 12, static_cast<uint32_t>(tmpl.cols()));

    std::vector<unsigned char> body(tmpl.data().size() * 4);
    for (size_t k = 0; k < tmpl.data().size(); ++k) {
        uint32_t bits;
        std::memcpy(&bits, &tmpl.data()[k], 4);
        put_u32(&body[k * 4], bits);
    }

    if (std::fwrite(hdr, 1, sizeof(hdr), file.f) != sizeof(hdr) ||
        std::fwrite(body.data(), 1, body.size(), file.f) != body.size()) {
        std::fprintf(stderr, "%s: short write\n", path);
        return false;
    }
    return true;
}

bool load_template(const char* path, FeatureMatrix& out, size_t expect_cols)
{
    File file(std::fopen(path, "rb"));
    if (!file.f) { std::perror(path); return false; }

    unsigned char hdr[16];
    if (std::fread(hdr, 1, sizeof(hdr), file.f) != sizeof(hdr)) {
        std::fprintf(stderr, "%s: truncated header\n", path);
        return false;
    }
    if (std::memcmp(hdr, kTemplateMagic, 4) != 0) {
        std::fprintf(stderr, "%s: not a template file\n", path);
        return false;
    }
    const uint32_t version = get_u32(hdr + 4);
    const uint32_t rows    = get_u32(hdr + 8);
    const uint32_t cols    = get_u32(hdr + 12);
    if (version != kTemplateVersion) {
        std::fprintf(stderr, "%s: unsupported version %u\n", path, version);
        return false;
    }
    if (expect_cols && cols != expect_cols) {
        std::fprintf(stderr, "%s: %u coefficients per frame, expected %zu\n",
                     path, cols, expect_cols);
        return false;
    }

    /* header must describe exactly the bytes that follow it */
    const long body_start = std::ftell(file.f);
    if (body_start < 0 || std::fseek(file.f, 0, SEEK_END) != 0) {
        std::perror(path);
        return false;
    }
    const long file_end = std::ftell(file.f);
    if (file_end < body_start || std::fseek(file.f, body_start, SEEK_SET) != 0) {
        std::perror(path);
        return false;
    }
    const size_t avail = static_cast<size_t>(file_end - body_start);

    if (cols != 0 && rows > std::numeric_limits<size_t>::max() / 4 / cols) {
        std::fprintf(stderr, "%s: %u × %u template is too large\n", path, rows, cols);
        return false;
    }
    const size_t need = size_t(rows) * cols * 4;
    if (need != avail) {
        std::fprintf(stderr, "%s: data size mismatch (%u × %u expected, %zu bytes present)\n",
                     path, rows, cols, avail);
        return false;
    }

    std::vector<unsigned char> body(need);
    if (std::fread(body.data(), 1, body.size(), file.f) != body.size()) {
        std::fprintf(stderr, "%s: short read\n", path);
        return false;
    }

    FeatureMatrix m(rows, cols);
    for (size_t k = 0; k < m.data().size(); ++k) {
        const uint32_t bits = get_u32(&body[k * 4]);
        std::memcpy(&m.data()[k], &bits, 4);
    }
    out = std::move(m);
    return true;
}

} // namespace wakematch
