#pragma once
#include <vector>
#include <cstddef>

namespace wakematch {

/* Dense row-major float matrix.  Keeps its column count even when it has
   zero rows, so an "audio too short" feature matrix still reports 13 cols. */
class Matrix {
public:
    Matrix() = default;
    Matrix(size_t rows, size_t cols, float fill = 0.f)
        : rows_(rows), cols_(cols), data_(rows * cols, fill) {}

    size_t rows()  const { return rows_; }
    size_t cols()  const { return cols_; }
    bool   empty() const { return rows_ == 0; }

    float&       operator()(size_t r, size_t c)       { return data_[r * cols_ + c]; }
    const float& operator()(size_t r, size_t c) const { return data_[r * cols_ + c]; }

    float*       row(size_t r)       { return data_.data() + r * cols_; }
    const float* row(size_t r) const { return data_.data() + r * cols_; }

    const std::vector<float>& data() const { return data_; }
    std::vector<float>&       data()       { return data_; }

    /* out = this · v   (v.size() must equal cols()) */
    void mul_vec(const float* v, float* out) const
    {
        for (size_t r = 0; r < rows_; ++r) {
            const float* w = row(r);
            float acc = 0.f;
            for (size_t c = 0; c < cols_; ++c)
                acc += w[c] * v[c];
            out[r] = acc;
        }
    }

private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<float> data_;
};

/* frames × coefficients */
using FeatureMatrix = Matrix;

} // namespace wakematch
