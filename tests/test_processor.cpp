#include <catch2/catch.hpp>

#include <sift/processor.hpp>
#include <sift/stage_index.hpp>

#include "test_utils.hpp"

namespace
{
    using namespace sift;
    using namespace sift::test;
    namespace fs = std::filesystem;
}

TEST_CASE("Apply flips membership and renames the file", "[processor]")
{
    TempDir dir;
    MakeStageDirs(dir.path());
    WriteItem(dir.path(), Stage::Review, 101, "first comment");

    StageIndex index;
    index.seed(Stage::Review, {101});
    Processor processor(dir.path(), index);

    REQUIRE(processor.apply({101, Stage::Accept, Stage::Review}) == MoveOutcome::Moved);

    REQUIRE_FALSE(index.contains(Stage::Review, 101));
    REQUIRE(index.contains(Stage::Accept, 101));
    REQUIRE_FALSE(fs::exists(ItemFile(dir.path(), Stage::Review, 101)));
    REQUIRE(ReadFile(ItemFile(dir.path(), Stage::Accept, 101)) == "first comment");
}

TEST_CASE("A second move of the same id is stale and touches nothing", "[processor][stale]")
{
    TempDir dir;
    MakeStageDirs(dir.path());
    WriteItem(dir.path(), Stage::Review, 201, "x");

    StageIndex index;
    index.seed(Stage::Review, {201});
    Processor processor(dir.path(), index);

    REQUIRE(processor.apply({201, Stage::Reject, Stage::Review}) == MoveOutcome::Moved);
    REQUIRE(processor.apply({201, Stage::Accept, Stage::Review}) == MoveOutcome::Stale);

    REQUIRE(index.contains(Stage::Reject, 201));
    REQUIRE_FALSE(index.contains(Stage::Accept, 201));
    REQUIRE(fs::exists(ItemFile(dir.path(), Stage::Reject, 201)));
    REQUIRE_FALSE(fs::exists(ItemFile(dir.path(), Stage::Accept, 201)));
}

TEST_CASE("Unknown ids are stale", "[processor][stale]")
{
    TempDir dir;
    MakeStageDirs(dir.path());

    StageIndex index;
    Processor processor(dir.path(), index);

    REQUIRE(processor.apply({999, Stage::Accept, Stage::Review}) == MoveOutcome::Stale);
    REQUIRE_FALSE(index.contains(Stage::Accept, 999));
}

TEST_CASE("A move to the same stage is stale", "[processor][stale]")
{
    TempDir dir;
    MakeStageDirs(dir.path());
    WriteItem(dir.path(), Stage::Review, 5, "x");

    StageIndex index;
    index.seed(Stage::Review, {5});
    Processor processor(dir.path(), index);

    REQUIRE(processor.apply({5, Stage::Review, Stage::Review}) == MoveOutcome::Stale);
    REQUIRE(index.contains(Stage::Review, 5));
    REQUIRE(fs::exists(ItemFile(dir.path(), Stage::Review, 5)));
}

TEST_CASE("The source stage is taken from the request", "[processor]")
{
    TempDir dir;
    MakeStageDirs(dir.path());
    WriteItem(dir.path(), Stage::Accept, 42, "reconsidered");

    StageIndex index;
    index.seed(Stage::Accept, {42});
    Processor processor(dir.path(), index);

    REQUIRE(processor.apply({42, Stage::Review, Stage::Review}) == MoveOutcome::Stale);
    REQUIRE(processor.apply({42, Stage::Reject, Stage::Accept}) == MoveOutcome::Moved);
    REQUIRE(index.contains(Stage::Reject, 42));
    REQUIRE(ReadFile(ItemFile(dir.path(), Stage::Reject, 42)) == "reconsidered");
}

TEST_CASE("A failed rename keeps the index in its post-move state", "[processor][storage]")
{
    TempDir dir;
    MakeStageDirs(dir.path());
    // Indexed but no backing file

    StageIndex index;
    index.seed(Stage::Review, {77});
    Processor processor(dir.path(), index);

    REQUIRE(processor.apply({77, Stage::Accept, Stage::Review}) == MoveOutcome::StorageError);
    REQUIRE_FALSE(index.contains(Stage::Review, 77));
    REQUIRE(index.contains(Stage::Accept, 77));
}

TEST_CASE("An existing destination file is never overwritten", "[processor][storage]")
{
    TempDir dir;
    MakeStageDirs(dir.path());
    WriteItem(dir.path(), Stage::Review, 9, "new");
    WriteItem(dir.path(), Stage::Accept, 9, "old");

    StageIndex index;
    index.seed(Stage::Review, {9});
    Processor processor(dir.path(), index);

    REQUIRE(processor.apply({9, Stage::Accept, Stage::Review}) == MoveOutcome::StorageError);
    REQUIRE(ReadFile(ItemFile(dir.path(), Stage::Accept, 9)) == "old");
    REQUIRE(ReadFile(ItemFile(dir.path(), Stage::Review, 9)) == "new");
    REQUIRE(index.contains(Stage::Accept, 9));
}

TEST_CASE("itemPath joins root, stage directory and id", "[processor]")
{
    StageIndex index;
    Processor processor("/srv/sift", index);
    REQUIRE(processor.itemPath(Stage::Reject, 12) == fs::path("/srv/sift/reject/12"));
}
