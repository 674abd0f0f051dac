#include <benchmark/benchmark.h>
#include <cstdint>
#include <kara/document.hpp>
#include <kara/timeline.hpp>
#include <string>

#include "ui/edit_session.hpp"

using namespace kara;

// --- Helpers ---

static AnimationData make_song(std::size_t line_count, std::size_t keyframes_per_line)
{
    AnimationData data;
    float         t = 0.0f;
    for (std::size_t i = 0; i < line_count; ++i)
    {
        LyricLine& line = data.add_line("Line number " + std::to_string(i) + " of the song", t, t + 4.0f);
        for (std::size_t k = 1; k < keyframes_per_line; ++k)
        {
            float f = static_cast<float>(k) / static_cast<float>(keyframes_per_line);
            line.add_keyframe_pct(f * 4.0f, f);
        }
        if (i % 16 == 0)
            line.part = "verse";
        t += 4.5f;
    }
    return data;
}

// --- Codec ---

static void BM_EncodeDocument(benchmark::State& state)
{
    AnimationData data = make_song(static_cast<std::size_t>(state.range(0)), 8);
    for (auto _ : state)
    {
        std::string doc = encode_document(data);
        benchmark::DoNotOptimize(doc);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EncodeDocument)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_DecodeDocument(benchmark::State& state)
{
    std::string doc = encode_document(make_song(static_cast<std::size_t>(state.range(0)), 8));
    for (auto _ : state)
    {
        DecodeResult result = decode_document(doc);
        benchmark::DoNotOptimize(result);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(doc.size()));
}
BENCHMARK(BM_DecodeDocument)->Arg(100)->Arg(1000)->Arg(10000);

// --- Timeline ---

static void BM_GetCurrentIndex(benchmark::State& state)
{
    AnimationData data = make_song(1, static_cast<std::size_t>(state.range(0)));
    const auto&   line = data.lines[0];
    float         t    = 0.0f;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize(line.get_current_index(t));
        t += 0.01f;
        if (t > 4.0f)
            t = 0.0f;
    }
}
BENCHMARK(BM_GetCurrentIndex)->Arg(4)->Arg(64)->Arg(1024);

static void BM_SessionPlayback(benchmark::State& state)
{
    EditSession session(make_song(1000, 8));
    session.handle_key(KeyEvent::press(keys::SPACE));
    for (auto _ : state)
    {
        session.update(1.0f / 60.0f);
        benchmark::DoNotOptimize(session.current_time());
    }
}
BENCHMARK(BM_SessionPlayback);
