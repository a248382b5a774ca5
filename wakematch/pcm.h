#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>

namespace wakematch {

enum class SampleFormat { F32, I16, U16 };

/* -------- single-sample conversions to float [-1 … 1] ------------------- */
inline float from_f32(float v)    { return v; }
inline float from_i16(int16_t v)  { return v / 32767.f; }
inline float from_u16(uint16_t v) { return (static_cast<int32_t>(v) - 32768) / 32768.f; }

/* -------- interleaved buffer → mono float ------------------------------- */
template<typename T, float (*CONV)(T)>
void to_mono(const T* in, size_t n_frames, size_t channels, std::vector<float>& out)
{
    out.reserve(out.size() + n_frames);
    if (channels <= 1) {
        for (size_t i = 0; i < n_frames; ++i)
            out.push_back(CONV(in[i]));
        return;
    }
    for (size_t i = 0; i < n_frames; ++i) {
        float acc = 0.f;
        for (size_t c = 0; c < channels; ++c)
            acc += CONV(in[i * channels + c]);
        out.push_back(acc / channels);
    }
}

/* Conversion routine chosen once per stream from its sample format;
   append() then runs without a per-sample branch on the format. */
class SampleConverter {
public:
    SampleConverter(SampleFormat fmt, size_t channels)
        : fmt_(fmt), channels_(channels ? channels : 1)
    {
        switch (fmt) {
            case SampleFormat::F32: fn_ = &append_f32; break;
            case SampleFormat::I16: fn_ = &append_i16; break;
            case SampleFormat::U16: fn_ = &append_u16; break;
        }
    }

    /* data holds n_frames · channels interleaved samples of format() */
    void append(const void* data, size_t n_frames, std::vector<float>& out) const
    {
        fn_(data, n_frames, channels_, out);
    }

    SampleFormat format()   const { return fmt_; }
    size_t       channels() const { return channels_; }

private:
    using AppendFn = void (*)(const void*, size_t, size_t, std::vector<float>&);

    static void append_f32(const void* d, size_t n, size_t ch, std::vector<float>& o)
    { to_mono<float, from_f32>(static_cast<const float*>(d), n, ch, o); }
    static void append_i16(const void* d, size_t n, size_t ch, std::vector<float>& o)
    { to_mono<int16_t, from_i16>(static_cast<const int16_t*>(d), n, ch, o); }
    static void append_u16(const void* d, size_t n, size_t ch, std::vector<float>& o)
    { to_mono<uint16_t, from_u16>(static_cast<const uint16_t*>(d), n, ch, o); }

    SampleFormat fmt_;
    size_t       channels_;
    AppendFn     fn_ = &append_f32;
};

} // namespace wakematch
