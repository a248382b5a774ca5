#pragma once
#include "matrix.h"
#include <cstddef>
#include <cstdint>

namespace wakematch {

/* On-disk template, little-endian:
     "WKMT"  u32 version (1)  u32 rows  u32 cols  f32[rows·cols] row-major */
constexpr char     kTemplateMagic[4] = { 'W', 'K', 'M', 'T' };
constexpr uint32_t kTemplateVersion  = 1;

/* Both return false and print the reason to stderr on failure. */
bool save_template(const char* path, const FeatureMatrix& tmpl);

/* expect_cols == 0 accepts any column count */
bool load_template(const char* path, FeatureMatrix& out, size_t expect_cols = 0);

} // namespace wakematch
