// main.cc  –  WAV → MFCC → DTW wake-word matcher   (command line edition)
#include "wakematch/detector.h"
#include "wakematch/pcm.h"
#include "wakematch/stream_scanner.h"
#include "wakematch/synth.h"
#include "wakematch/template_file.h"
#include <sndfile.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>
#include <string>
#include <utility>

using namespace wakematch;

// ──────────── pretty console helpers ────────────
#define BAR   "============================================================\n"
#define SECTION(txt) do { puts("\n" BAR txt "\n" BAR); } while (0)
#define CHECK(x, msg) do { if(!(x)){fprintf(stderr,"ERROR: %s\n",msg); exit(1);} } while(0)

constexpr int kExitNotDetected = 2;

// ──────────── WAV loader (mono float, any channel count) ───────────
static bool load_wav(const char* path, size_t expect_sr, std::vector<float>& out)
{
    SF_INFO info{};
    SNDFILE* sf = sf_open(path, SFM_READ, &info);
    if (!sf) {
        fprintf(stderr, "%s: %s\n", path, sf_strerror(nullptr));
        return false;
    }

    if (info.samplerate != static_cast<int>(expect_sr) || info.channels < 1) {
        fprintf(stderr, "%s: need %zu Hz audio (got %d ch @ %d Hz)\n",
                path, expect_sr, info.channels, info.samplerate);
        sf_close(sf);
        return false;
    }

    std::vector<float> interleaved(static_cast<size_t>(info.frames) * info.channels);
    const sf_count_t got = sf_readf_float(sf, interleaved.data(), info.frames);
    sf_close(sf);
    if (got != info.frames) {
        fprintf(stderr, "%s: read %lld of %lld frames\n",
                path, static_cast<long long>(got), static_cast<long long>(info.frames));
        return false;
    }

    out.clear();
    SampleConverter conv(SampleFormat::F32, static_cast<size_t>(info.channels));
    conv.append(interleaved.data(), static_cast<size_t>(got), out);
    return true;
}

// ──────────── threshold: -t wins over $WAKEMATCH_THRESHOLD ─────
static bool parse_float(const char* s, float& v)
{
    char* end = nullptr;
    v = std::strtof(s, &end);
    return end != s && *end == '\0';
}

static bool pick_threshold(int argc, char** argv, int first, float& thr)
{
    thr = kDefaultThreshold;
    if (const char* env = getenv("WAKEMATCH_THRESHOLD")) {
        if (!parse_float(env, thr)) {
            fprintf(stderr, "WAKEMATCH_THRESHOLD: not a number: '%s'\n", env);
            return false;
        }
    }
    for (int i = first; i < argc; ++i) {
        if (strcmp(argv[i], "-t") != 0) continue;
        if (i + 1 >= argc || !parse_float(argv[i + 1], thr)) {
            fprintf(stderr, "-t needs a number\n");
            return false;
        }
        ++i;
    }
    return true;
}

static void usage(const char* prog)
{
    fprintf(stderr,
            "usage: %s train  template.out  a.wav [b.wav ...]\n"
            "       %s detect template  audio.wav [-t threshold]\n"
            "       %s scan   template  audio.wav [-t threshold]\n"
            "       %s demo\n",
            prog, prog, prog, prog);
}

// ──────────── train ─────────────────────────────
static int cmd_train(Detector& det, int argc, char** argv)
{
    if (argc < 4) { usage(argv[0]); return 1; }
    const char* out_path = argv[2];

    SECTION("1/3  WAV → RAM");
    std::vector<std::vector<float>> takes;
    for (int i = 3; i < argc; ++i) {
        std::vector<float> wav;
        CHECK(load_wav(argv[i], det.config().sample_rate, wav), "loading WAV failed");
        printf("Loaded %zu samples from %s\n", wav.size(), argv[i]);
        takes.push_back(std::move(wav));
    }

    SECTION("2/3  Train template");
    const TrainStatus st = det.train_template(takes);
    if (st != TrainStatus::Ok) {
        fprintf(stderr, "ERROR: training failed: %s\n", to_string(st));
        return 1;
    }
    printf("Template shape : %zu × %zu  (frames × mfcc)\n",
           det.get_template().rows(), det.get_template().cols());

    for (size_t i = 0; i < takes.size(); ++i) {
        const Detection d = det.detect(takes[i]);
        printf("  take %zu: %s  similarity=%.3f\n",
               i + 1, d.detected ? "MATCH" : "miss ", d.similarity);
    }

    SECTION("3/3  Save");
    CHECK(save_template(out_path, det.get_template()), "saving template failed");
    printf("Template written to %s\n", out_path);
    return 0;
}

// ──────────── detect ────────────────────────────
static int cmd_detect(Detector& det, int argc, char** argv)
{
    if (argc < 4) { usage(argv[0]); return 1; }
    float thr;
    if (!pick_threshold(argc, argv, 4, thr)) return 1;
    det.set_threshold(thr);

    FeatureMatrix tmpl;
    CHECK(load_template(argv[2], tmpl, det.config().num_mfcc), "loading template failed");
    det.set_template(std::move(tmpl));

    std::vector<float> wav;
    CHECK(load_wav(argv[3], det.config().sample_rate, wav), "loading WAV failed");

    const Detection d = det.detect(wav);
    printf("%s  similarity=%.3f  threshold=%.2f\n",
           d.detected ? "DETECTED" : "not detected", d.similarity, det.threshold());
    return d.detected ? 0 : kExitNotDetected;
}

// ──────────── scan (2 s rolling window, 100 ms blocks, 3 s cooldown) ─────
static int cmd_scan(Detector& det, int argc, char** argv)
{
    if (argc < 4) { usage(argv[0]); return 1; }
    float thr;
    if (!pick_threshold(argc, argv, 4, thr)) return 1;
    det.set_threshold(thr);

    FeatureMatrix tmpl;
    CHECK(load_template(argv[2], tmpl, det.config().num_mfcc), "loading template failed");
    det.set_template(std::move(tmpl));

    std::vector<float> wav;
    CHECK(load_wav(argv[3], det.config().sample_rate, wav), "loading WAV failed");

    const size_t sr = det.config().sample_rate;
    StreamScanner scanner(det);

    const auto hits = scanner.feed(wav.data(), wav.size());
    for (const ScanHit& h : hits)
        printf("  %7.2f s  DETECTED  similarity=%.3f\n",
               double(h.end_sample) / sr, h.similarity);

    printf("%zu detection(s) in %.2f s of audio\n", hits.size(), double(wav.size()) / sr);
    return hits.empty() ? kExitNotDetected : 0;
}

// ──────────── demo (synthetic sweep vs noise) ─────
static int cmd_demo(Detector& det)
{
    const size_t sr = det.config().sample_rate;

    SECTION("1/2  Sweep 300 → 1500 Hz as its own template");
    const auto sweep = chirp(sr, 1.f, 300.f, 1500.f);
    FeatureMatrix mfcc = det.extract(sweep);
    printf("MFCC shape : %zu × %zu\n", mfcc.rows(), mfcc.cols());
    det.set_template(std::move(mfcc));

    Detection d = det.detect(sweep);
    printf("sweep : %s  similarity=%.3f\n", d.detected ? "DETECTED" : "not detected", d.similarity);

    SECTION("2/2  Noise against the sweep template");
    NoiseSource noise(42);
    d = det.detect(noise.generate(sr, 0.1f));
    printf("noise : %s  similarity=%.3f\n", d.detected ? "DETECTED" : "not detected", d.similarity);
    return 0;
}

// ──────────── main ───────────────────────────────
int main(int argc, char** argv)
{
    if (argc < 2) { usage(argv[0]); return 1; }

    Detector det;
    const std::string cmd = argv[1];
    if (cmd == "train")  return cmd_train(det, argc, argv);
    if (cmd == "detect") return cmd_detect(det, argc, argv);
    if (cmd == "scan")   return cmd_scan(det, argc, argv);
    if (cmd == "demo")   return cmd_demo(det);

    usage(argv[0]);
    return 1;
}
