#include <benchmark/benchmark.h>

#include <replayhub/looping_series_store.hpp>
#include <replayhub/subscription_hub.hpp>

#include <chrono>
#include <string>
#include <utility>
#include <vector>

// Publish one value and wait until every subscriber has pulled it.
static void fanout(benchmark::State& st) {
    const auto n_subscribers = static_cast<int>(st.range(0));

    replayhub::HubOptions options;
    options.channel_capacity = 0;
    replayhub::SubscriptionHub<std::size_t> hub(options);

    std::vector<replayhub::Subscription<std::size_t>> subscribers;
    for (int i = 0; i < n_subscribers; ++i) {
        subscribers.push_back(hub.subscribe({"bench-" + std::to_string(i), "bench"}));
    }

    std::size_t iteration = 0;
    for (auto _ : st) {
        hub.publish(iteration++);
        for (auto& sub : subscribers) {
            auto message = sub.next(std::chrono::seconds(1));
            benchmark::DoNotOptimize(message);
        }
    }

    st.SetItemsProcessed(st.iterations() * n_subscribers);
}

BENCHMARK(fanout)->Arg(1)->Arg(8)->Arg(64);

// Looped raw query over a dataset replayed many times.
static void looped_raw_query(benchmark::State& st) {
    using replayhub::Timestamp;
    const auto passes = st.range(0);

    replayhub::DatasetBuilder builder(true);
    for (int i = 0; i <= 60; ++i) {
        builder.add("S", Timestamp(std::chrono::seconds(i)), std::to_string(i));
    }
    replayhub::LoopingSeriesStore store(std::move(builder).build());

    replayhub::RawQuery query{{"S"},
                              Timestamp(std::chrono::seconds(60)),
                              Timestamp(std::chrono::seconds(60 + 60 * passes)),
                              replayhub::BoundaryType::Outside,
                              0};
    std::size_t points = 0;
    for (auto _ : st) {
        store.read_raw(query, [&points](replayhub::SeriesQueryResult&& result) {
            benchmark::DoNotOptimize(result);
            ++points;
        });
    }

    st.SetItemsProcessed(static_cast<int64_t>(points));
}

BENCHMARK(looped_raw_query)->Arg(1)->Arg(100);

BENCHMARK_MAIN();
