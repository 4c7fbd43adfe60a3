#include <catch2/catch.hpp>

#include <sift/mover.hpp>
#include <sift/stage_index.hpp>

#include "test_utils.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

namespace
{
    using namespace sift;
    using namespace sift::test;
    namespace fs = std::filesystem;

    constexpr auto kDrainTimeout = std::chrono::milliseconds(5000);

    struct Fixture
    {
        TempDir dir;
        StageIndex index;
        Processor processor{dir.path(), index};

        Fixture() { MakeStageDirs(dir.path()); }

        void Seed(Stage stage, std::initializer_list<ItemId> ids)
        {
            for (ItemId id : ids)
                WriteItem(dir.path(), stage, id, "item " + std::to_string(id));
            index.seed(stage, std::vector<ItemId>(ids));
        }
    };
}

TEST_CASE("Accepting an item moves it once drained", "[mover][scenario]")
{
    Fixture f;
    f.Seed(Stage::Review, {101, 102});

    Mover mover(f.processor, 16);
    REQUIRE(mover.start());

    REQUIRE(mover.submit({101, Stage::Accept, Stage::Review}));
    REQUIRE(mover.drain(kDrainTimeout));

    REQUIRE_FALSE(f.index.contains(Stage::Review, 101));
    REQUIRE(f.index.contains(Stage::Accept, 101));
    REQUIRE(f.index.contains(Stage::Review, 102));
    REQUIRE_FALSE(fs::exists(ItemFile(f.dir.path(), Stage::Review, 101)));
    REQUIRE(fs::exists(ItemFile(f.dir.path(), Stage::Accept, 101)));
}

TEST_CASE("Reject followed by accept leaves the item rejected", "[mover][scenario][stale]")
{
    Fixture f;
    f.Seed(Stage::Review, {201});

    Mover mover(f.processor, 16);
    REQUIRE(mover.start());

    REQUIRE(mover.submit({201, Stage::Reject, Stage::Review}));
    REQUIRE(mover.submit({201, Stage::Accept, Stage::Review}));
    REQUIRE(mover.drain(kDrainTimeout));

    REQUIRE(f.index.contains(Stage::Reject, 201));
    REQUIRE_FALSE(f.index.contains(Stage::Accept, 201));
    REQUIRE(fs::exists(ItemFile(f.dir.path(), Stage::Reject, 201)));
    REQUIRE_FALSE(fs::exists(ItemFile(f.dir.path(), Stage::Accept, 201)));

    MoverStats stats = mover.stats();
    REQUIRE(stats.moved == 1);
    REQUIRE(stats.stale == 1);
    REQUIRE(stats.failed == 0);
}

TEST_CASE("Duplicate requests produce exactly one move", "[mover][stale]")
{
    Fixture f;
    f.Seed(Stage::Review, {7});

    Mover mover(f.processor, 16);
    REQUIRE(mover.start());

    REQUIRE(mover.submit({7, Stage::Accept, Stage::Review}));
    REQUIRE(mover.submit({7, Stage::Accept, Stage::Review}));
    REQUIRE(mover.drain(kDrainTimeout));

    REQUIRE(mover.stats().moved == 1);
    REQUIRE(mover.stats().stale == 1);
    REQUIRE(ReadFile(ItemFile(f.dir.path(), Stage::Accept, 7)) == "item 7");
}

TEST_CASE("Requests from one producer are applied in submission order", "[mover][order]")
{
    Fixture f;
    std::vector<MoveRequest> submitted;
    for (ItemId id = 1; id <= 200; ++id)
    {
        f.Seed(Stage::Review, {id});
        submitted.push_back({id, id % 3 == 0 ? Stage::Reject : Stage::Accept, Stage::Review});
    }

    std::mutex seenMutex;
    std::vector<ItemId> seen;

    Mover mover(f.processor, 8);
    REQUIRE(mover.start([&](const MoveRequest &request, MoveOutcome)
                        {
                            std::lock_guard<std::mutex> lock(seenMutex);
                            seen.push_back(request.id);
                        }));

    for (const auto &request : submitted)
        REQUIRE(mover.submit(request));
    REQUIRE(mover.drain(kDrainTimeout));

    std::lock_guard<std::mutex> lock(seenMutex);
    REQUIRE(seen.size() == submitted.size());
    for (std::size_t i = 0; i < seen.size(); ++i)
        REQUIRE(seen[i] == submitted[i].id);
    REQUIRE(f.index.size(Stage::Review) == 0);
}

TEST_CASE("Concurrent producers each move their own items exactly once", "[mover][concurrency]")
{
    Fixture f;
    constexpr int kProducers = 4;
    constexpr ItemId kPerProducer = 50;
    for (ItemId id = 1; id <= kProducers * kPerProducer; ++id)
        f.Seed(Stage::Review, {id});

    Mover mover(f.processor, 4);
    REQUIRE(mover.start());

    std::atomic<int> failures{0};
    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p)
    {
        producers.emplace_back([&, p]()
                               {
                                   for (ItemId i = 1; i <= kPerProducer; ++i)
                                   {
                                       ItemId id = p * kPerProducer + i;
                                       // Every item is submitted twice; the second is stale
                                       if (!mover.submit({id, Stage::Accept, Stage::Review}))
                                           failures.fetch_add(1);
                                       if (!mover.submit({id, Stage::Reject, Stage::Review}))
                                           failures.fetch_add(1);
                                   }
                               });
    }
    for (auto &t : producers)
        t.join();

    REQUIRE(mover.drain(kDrainTimeout));
    REQUIRE(failures.load() == 0);

    MoverStats stats = mover.stats();
    REQUIRE(stats.moved == kProducers * kPerProducer);
    REQUIRE(stats.stale == kProducers * kPerProducer);
    REQUIRE(f.index.size(Stage::Accept) == kProducers * kPerProducer);
    REQUIRE(f.index.size(Stage::Reject) == 0);
}

TEST_CASE("A full queue blocks submit and rejects trySubmit", "[mover][backpressure][scenario]")
{
    Fixture f;
    f.Seed(Stage::Review, {1, 2, 3, 4, 5});

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<bool> firstInFlight{false};

    Mover mover(f.processor, 2);
    REQUIRE(mover.start([&](const MoveRequest &request, MoveOutcome)
                        {
                            if (request.id == 1)
                            {
                                firstInFlight.store(true);
                                gate.wait();
                            }
                        }));

    REQUIRE(mover.submit({1, Stage::Accept, Stage::Review}));
    REQUIRE(WaitUntil([&]() { return firstInFlight.load(); }));

    // Mover is held inside request 1; fill the queue behind it
    REQUIRE(mover.submit({2, Stage::Accept, Stage::Review}));
    REQUIRE(mover.submit({3, Stage::Accept, Stage::Review}));
    REQUIRE(mover.queueSize() == 2);

    EnqueueResult rejected = mover.trySubmit({4, Stage::Accept, Stage::Review});
    REQUIRE_FALSE(rejected);
    REQUIRE(rejected.error == EnqueueError::QueueFull);

    std::atomic<bool> returned{false};
    EnqueueResult blocked;
    std::thread producer([&]()
                         {
                             blocked = mover.submit({5, Stage::Accept, Stage::Review});
                             returned.store(true);
                         });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE_FALSE(returned.load());

    release.set_value();
    REQUIRE(WaitUntil([&]() { return returned.load(); }));
    producer.join();
    REQUIRE(blocked);

    REQUIRE(mover.drain(kDrainTimeout));
    REQUIRE(f.index.contains(Stage::Accept, 5));
    REQUIRE(f.index.contains(Stage::Review, 4));
}

TEST_CASE("Stopping the mover rejects further submissions", "[mover][shutdown]")
{
    Fixture f;
    f.Seed(Stage::Review, {1});

    Mover mover(f.processor, 4);
    REQUIRE(mover.start());
    mover.stop();

    REQUIRE_FALSE(mover.isRunning());
    EnqueueResult result = mover.submit({1, Stage::Accept, Stage::Review});
    REQUIRE_FALSE(result);
    REQUIRE(result.error == EnqueueError::Closed);
    REQUIRE(f.index.contains(Stage::Review, 1));
    REQUIRE(mover.drain(std::chrono::milliseconds(10)));
    REQUIRE_FALSE(mover.start());
}

TEST_CASE("Requests still queued at stop are discarded without being applied", "[mover][shutdown]")
{
    Fixture f;
    f.Seed(Stage::Review, {1, 2, 3});

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<bool> firstInFlight{false};

    Mover mover(f.processor, 4);
    REQUIRE(mover.start([&](const MoveRequest &request, MoveOutcome)
                        {
                            if (request.id == 1)
                            {
                                firstInFlight.store(true);
                                gate.wait();
                            }
                        }));

    REQUIRE(mover.submit({1, Stage::Accept, Stage::Review}));
    REQUIRE(WaitUntil([&]() { return firstInFlight.load(); }));
    REQUIRE(mover.submit({2, Stage::Accept, Stage::Review}));
    REQUIRE(mover.submit({3, Stage::Accept, Stage::Review}));

    std::thread stopper([&]() { mover.stop(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    release.set_value();
    stopper.join();

    // The in-flight move completes; the queued ones never run
    REQUIRE(f.index.contains(Stage::Accept, 1));
    REQUIRE(f.index.contains(Stage::Review, 2));
    REQUIRE(f.index.contains(Stage::Review, 3));
    REQUIRE(mover.drain(std::chrono::milliseconds(10)));
}
