/**
 * @file TestSnippetStore.cpp
 * @brief Unit tests for snippet parsing, naming and directory I/O.
 */

#include <catch2/catch_test_macros.hpp>

#include "spk/eog/snippet/SnippetStore.hpp"

#include <filesystem>
#include <fstream>

namespace spk::eog {

using namespace eog::snippet;

namespace {

/// Fresh scratch directory removed on scope exit.
struct ScratchDir {
    std::filesystem::path path;

    explicit ScratchDir(std::string_view name)
        : path(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }
    ~ScratchDir() { std::filesystem::remove_all(path); }
};

Snippet makeSnippet(std::string id, Label label, std::size_t n)
{
    std::vector<double> signal(n);
    std::vector<double> time(n);
    for (std::size_t i = 0; i < n; ++i) {
        signal[i] = (i % 3 == 0) ? 1.0 : -0.5;
        time[i] = static_cast<double>(i) / 100.0;
    }
    return Snippet(std::move(id), std::move(label), std::move(signal), std::move(time));
}

} // namespace

TEST_CASE("SnippetStore::getSnippetEvent", "[snippet]")
{
    REQUIRE(*SnippetStore::getSnippetEvent("rec01_left_3.npy") == "left");
    REQUIRE(*SnippetStore::getSnippetEvent("rec01_left.npy") == "left");
    REQUIRE(*SnippetStore::getSnippetEvent("session_2_blink_12.npy") == "blink");
    REQUIRE(*SnippetStore::getSnippetEvent("rec_noise_1.npy") == "noise");
    REQUIRE(*SnippetStore::getSnippetEvent("right") == "right");
    REQUIRE(*SnippetStore::getSnippetEvent("/tmp/x/rec_right_2.npy") == "right");

    REQUIRE(SnippetStore::getSnippetEvent("12.npy").error().code == ErrorCode::kFileParseError);
    REQUIRE(SnippetStore::getSnippetEvent("12_4.npy").error().code == ErrorCode::kFileParseError);
    REQUIRE(SnippetStore::getSnippetEvent("rec__3.npy").error().code == ErrorCode::kFileParseError);
}

TEST_CASE("SnippetStore::parseSnippet", "[snippet]")
{
    SECTION("Two rows split into signal and time")
    {
        io::NpyArray array{{2, 3}, {0.5, -1.0, 0.25, 0.0, 0.1, 0.2}};
        auto data = SnippetStore::parseSnippet(array);
        REQUIRE(data.has_value());
        REQUIRE(data->signal == std::vector<double>{0.5, -1.0, 0.25});
        REQUIRE(data->time == std::vector<double>{0.0, 0.1, 0.2});

        const Snippet snippet("a_left_1", "left", data->signal, data->time);
        REQUIRE(SnippetStore::toArray(snippet) == array);
    }

    SECTION("Wrong shapes are rejected")
    {
        REQUIRE(SnippetStore::parseSnippet({{3, 2}, std::vector<double>(6, 0.0)}).error().code ==
                ErrorCode::kFileParseError);
        REQUIRE(SnippetStore::parseSnippet({{4}, std::vector<double>(4, 0.0)}).error().code ==
                ErrorCode::kFileParseError);
        REQUIRE(SnippetStore::parseSnippet({{2, 0}, {}}).error().code == ErrorCode::kFileParseError);
    }

    SECTION("A shape that disagrees with the stored values is rejected")
    {
        REQUIRE(SnippetStore::parseSnippet({{2, 5}, {1.0, 2.0}}).error().code == ErrorCode::kFileParseError);
        REQUIRE(SnippetStore::parseSnippet({{2, std::size_t{1} << 63}, {}}).error().code ==
                ErrorCode::kFileParseError);
    }
}

TEST_CASE("SnippetStore save and load", "[snippet]")
{
    ScratchDir dir("spk_test_snippets");
    const auto saved = makeSnippet("rec01_left_1", "left", 40);

    auto path = SnippetStore::save(dir.path / "nested", saved);
    REQUIRE(path.has_value());
    REQUIRE(path->filename() == "rec01_left_1.npy");

    auto loaded = SnippetStore::load(*path);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->id() == "rec01_left_1");
    REQUIRE(loaded->label() == "left");
    REQUIRE(loaded->size() == 40);
    REQUIRE(std::equal(loaded->signal().begin(), loaded->signal().end(), saved.signal().begin()));
    REQUIRE(std::equal(loaded->time().begin(), loaded->time().end(), saved.time().begin()));
}

TEST_CASE("SnippetStore::loadDirectory", "[snippet]")
{
    ScratchDir dir("spk_test_snippet_dir");

    REQUIRE(SnippetStore::save(dir.path, makeSnippet("b_right_1", "right", 20)).has_value());
    REQUIRE(SnippetStore::save(dir.path, makeSnippet("a_left_1", "left", 20)).has_value());
    REQUIRE(SnippetStore::save(dir.path, makeSnippet("a_left_2", "left", 25)).has_value());
    REQUIRE(SnippetStore::save(dir.path, makeSnippet("c_blink_1", "blink", 20)).has_value());
    REQUIRE(SnippetStore::save(dir.path, makeSnippet("17", "", 20)).has_value());
    std::ofstream(dir.path / "notes.txt") << "not a snippet\n";

    SECTION("Everything with a readable label, sorted by name")
    {
        auto all = SnippetStore::loadDirectory(dir.path);
        REQUIRE(all.has_value());
        REQUIRE(all->size() == 4);
        REQUIRE((*all)[0].id() == "a_left_1");
        REQUIRE((*all)[1].id() == "a_left_2");
        REQUIRE((*all)[2].id() == "b_right_1");
        REQUIRE((*all)[3].id() == "c_blink_1");
    }

    SECTION("Label filter")
    {
        auto lr = SnippetStore::loadDirectory(dir.path, {"left", "right"});
        REQUIRE(lr.has_value());
        REQUIRE(lr->size() == 3);
        for (const auto &s : *lr)
            REQUIRE(s.label() != "blink");
    }

    SECTION("Missing directory")
    {
        auto r = SnippetStore::loadDirectory(dir.path / "absent");
        REQUIRE(r.error().code == ErrorCode::kFileNotFound);
    }

    SECTION("Corrupt snippet file is an error")
    {
        std::ofstream(dir.path / "z_left_9.npy", std::ios::binary) << "garbage";
        auto r = SnippetStore::loadDirectory(dir.path);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::kFileParseError);
    }
}

} // namespace spk::eog
