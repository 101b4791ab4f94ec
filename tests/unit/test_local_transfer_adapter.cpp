#include <catch2/catch_test_macros.hpp>

#include "EngineException.hpp"
#include "LocalTransferAdapter.hpp"
#include "TestHelpers.hpp"

#include <filesystem>

namespace {

TransferOptions quick_options()
{
    TransferOptions options;
    options.timeout = std::chrono::seconds(60);
    return options;
}

} // namespace

TEST_CASE("Local copies land whole and leave no partial file") {
    TempDir dir;
    const auto source = dir.path() / "src" / "file.bin";
    const auto dest = dir.path() / "dst" / "sub" / "file.bin";
    write_file(source, std::string(4096, 'q'));

    LocalTransferAdapter adapter(dir.path().string(), "rsync", false);
    adapter.prepare_destination(dest.string());
    const auto result = adapter.transfer(source.string(), dest.string(), quick_options());

    REQUIRE(result.completed());
    CHECK(result.bytes_transferred == 4096);
    CHECK(read_file(dest) == read_file(source));
    CHECK_FALSE(std::filesystem::exists(LocalTransferAdapter::partial_path_for(dest.string())));
}

TEST_CASE("An interrupted local copy resumes from its partial file") {
    TempDir dir;
    const auto source = dir.path() / "file.txt";
    const auto dest = dir.path() / "copy.txt";
    write_file(source, "0123456789");
    write_file(LocalTransferAdapter::partial_path_for(dest.string()), "01234");

    LocalTransferAdapter adapter(dir.path().string(), "rsync", false);
    const auto result = adapter.transfer(source.string(), dest.string(), quick_options());

    REQUIRE(result.completed());
    CHECK(read_file(dest) == "0123456789");
    CHECK(LocalTransferAdapter::partial_path_for("/x/y.txt") == "/x/y.txt.ordne-partial");
}

TEST_CASE("Discarding a partial transfer removes both partial layouts") {
    TempDir dir;
    const auto dest = dir.path() / "dst" / "file.bin";
    const auto stream_partial = LocalTransferAdapter::partial_path_for(dest.string());
    const auto rsync_partial = LocalTransferAdapter::rsync_partial_path_for(dest.string());
    write_file(stream_partial, "0123");
    write_file(rsync_partial, "01");
    CHECK(rsync_partial == (dir.path() / "dst" / ".ordne-partial" / "file.bin").string());

    LocalTransferAdapter adapter(dir.path().string(), "rsync", false);
    adapter.discard_partial(dest.string());

    CHECK_FALSE(std::filesystem::exists(stream_partial));
    CHECK_FALSE(std::filesystem::exists(rsync_partial));
    CHECK_FALSE(std::filesystem::exists(dir.path() / "dst" / ".ordne-partial"));
    CHECK(std::filesystem::exists(dir.path() / "dst"));

    // Nothing left to discard is not an error
    adapter.discard_partial(dest.string());
}

TEST_CASE("Long local copies keep calling the heartbeat") {
    TempDir dir;
    const auto source = dir.path() / "big.bin";
    const auto dest = dir.path() / "copy.bin";
    write_file(source, std::string(3 * 1024 * 1024, 'h'));

    LocalTransferAdapter adapter(dir.path().string(), "rsync", false);
    int beats = 0;
    adapter.set_heartbeat([&beats] { ++beats; });
    REQUIRE(adapter.transfer(source.string(), dest.string(), quick_options()).completed());
    CHECK(beats > 0);

    const int after_copy = beats;
    adapter.compute_hash(dest.string(), HashAlgorithm::Sha256);
    CHECK(beats > after_copy);
}

TEST_CASE("A heartbeat that throws aborts the copy") {
    TempDir dir;
    const auto source = dir.path() / "big.bin";
    const auto dest = dir.path() / "copy.bin";
    write_file(source, std::string(3 * 1024 * 1024, 'h'));

    LocalTransferAdapter adapter(dir.path().string(), "rsync", false);
    adapter.set_heartbeat([] { THROW_ENGINE_ERROR(ErrorCodes::Code::RUN_LEASE_LOST, "taken over"); });

    CHECK_THROWS_AS(adapter.transfer(source.string(), dest.string(), quick_options()),
                    ErrorCodes::EngineException);
    CHECK_FALSE(std::filesystem::exists(dest));
}

TEST_CASE("Local adapter restores, links and removes") {
    TempDir dir;
    const auto original = dir.path() / "original.txt";
    const auto moved = dir.path() / "moved.txt";
    write_file(moved, "payload");

    LocalTransferAdapter adapter(dir.path().string(), "rsync", false);
    REQUIRE(adapter.restore(moved.string(), original.string(), quick_options()).completed());
    CHECK(read_file(original) == "payload");

    const auto link = dir.path() / "link.txt";
    REQUIRE(adapter.link(original.string(), link.string(), true).completed());
    CHECK(std::filesystem::is_symlink(link));
    CHECK_FALSE(adapter.link(original.string(), link.string(), true).completed());

    adapter.remove(link.string());
    CHECK_FALSE(adapter.exists(link.string()));
    CHECK(adapter.exists(original.string()));
    CHECK(adapter.space().has_value());
}
