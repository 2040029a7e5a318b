#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#include <doctest/doctest.h>

#include "lzxindex/index/block_index.hpp"
#include "lzx_test_helpers.hpp"

namespace {

namespace fs = std::filesystem;
using lzx::error_code;
using lzx::index::block_index_options;
using lzx::index::block_index_status;
using namespace lzx::test_helpers;

std::vector<uint8_t> make_archive(std::vector<uint64_t>* offsets = nullptr) {
  header_spec spec;
  spec.flags = lzx::index::lzop_flag_adler32_d;
  auto bytes = build_header(spec);
  uint64_t first = append_block(bytes, 256, 100, 1);
  uint64_t second = append_block(bytes, 256, 256, 1);
  uint64_t third = append_block(bytes, 128, 64, 1);
  append_sentinel(bytes);
  if (offsets) {
    *offsets = {first, second, third};
  }
  return bytes;
}

std::vector<uint8_t> encode_offsets(const std::vector<uint64_t>& offsets) {
  std::vector<uint8_t> out;
  be_buffer_writer writer(out);
  for (uint64_t offset : offsets) {
    writer.write_u64(offset);
  }
  return out;
}

redlog::logger test_log() { return redlog::get_logger("test.lzx.index"); }

} // namespace

TEST_CASE("create writes the index next to the source") {
  fs::path source = temp_path("lzx_index_create.lzo");
  fs::path index_path = source.string() + ".index";
  remove_files({source, index_path});

  std::vector<uint64_t> expected;
  write_file(source, make_archive(&expected));

  auto built = lzx::index::create_block_index(source.string(), {}, test_log());
  REQUIRE(built.ok());
  CHECK(built.value.offsets == expected);
  REQUIRE(built.value.header.has_value());
  CHECK(built.value.header->name == "payload.bin");

  REQUIRE(fs::exists(index_path));
  CHECK(read_file(index_path) == encode_offsets(expected));

  auto loaded = lzx::index::load_block_index(index_path.string(), test_log());
  REQUIRE(loaded.ok());
  CHECK(loaded.value.offsets == expected);
  CHECK_FALSE(loaded.value.header.has_value());

  remove_files({source, index_path});
}

TEST_CASE("create writes an empty index for an archive without blocks") {
  fs::path source = temp_path("lzx_index_empty.lzo");
  fs::path index_path = source.string() + ".index";
  remove_files({source, index_path});

  auto bytes = build_header(header_spec{});
  append_sentinel(bytes);
  write_file(source, bytes);

  auto built = lzx::index::create_block_index(source.string(), {}, test_log());
  REQUIRE(built.ok());
  CHECK(built.value.empty());
  REQUIRE(fs::exists(index_path));
  CHECK(fs::file_size(index_path) == 0);

  remove_files({source, index_path});
}

TEST_CASE("create leaves no index when the magic is damaged") {
  fs::path source = temp_path("lzx_index_bad_magic.lzo");
  fs::path index_path = source.string() + ".index";
  remove_files({source, index_path});

  auto bytes = make_archive();
  bytes[3] = 'X';
  write_file(source, bytes);
  // a previous index for this path must not survive
  write_file(index_path, encode_offsets({49}));

  auto built = lzx::index::create_block_index(source.string(), {}, test_log());
  CHECK(built.status_info.code == error_code::format_error);
  CHECK_FALSE(fs::exists(index_path));

  remove_files({source, index_path});
}

TEST_CASE("create leaves no index when a block is corrupt") {
  fs::path source = temp_path("lzx_index_corrupt.lzo");
  fs::path index_path = source.string() + ".index";
  remove_files({source, index_path});

  auto bytes = build_header(header_spec{});
  append_block(bytes, 64, 32, 0);
  append_block(bytes, 64, 65, 0);
  append_sentinel(bytes);
  write_file(source, bytes);

  auto built = lzx::index::create_block_index(source.string(), {}, test_log());
  CHECK(built.status_info.code == error_code::corruption);
  CHECK(built.value.empty());
  CHECK_FALSE(fs::exists(index_path));

  remove_files({source, index_path});
}

TEST_CASE("create reports missing sources as io errors") {
  fs::path source = temp_path("lzx_index_missing.lzo");
  remove_files({source});

  auto built = lzx::index::create_block_index(source.string(), {}, test_log());
  CHECK(built.status_info.code == error_code::io_error);

  auto empty = lzx::index::create_block_index("", {}, test_log());
  CHECK(empty.status_info.code == error_code::invalid_argument);
}

TEST_CASE("create honours an explicit index path") {
  fs::path source = temp_path("lzx_index_custom.lzo");
  fs::path index_path = temp_path("lzx_index_custom.offsets");
  fs::path default_path = source.string() + ".index";
  remove_files({source, index_path, default_path});
  write_file(source, make_archive());

  block_index_options options;
  options.index_path = index_path.string();
  auto built = lzx::index::create_block_index(source.string(), options, test_log());
  REQUIRE(built.ok());
  CHECK(fs::exists(index_path));
  CHECK_FALSE(fs::exists(default_path));

  remove_files({source, index_path});
}

TEST_CASE("load rejects malformed index files") {
  fs::path index_path = temp_path("lzx_index_malformed.index");

  SUBCASE("partial entry") {
    auto bytes = encode_offsets({49, 200});
    bytes.pop_back();
    write_file(index_path, bytes);
    auto loaded = lzx::index::load_block_index(index_path.string(), test_log());
    CHECK(loaded.status_info.code == error_code::format_error);
  }

  SUBCASE("offsets out of order") {
    write_file(index_path, encode_offsets({200, 49}));
    auto loaded = lzx::index::load_block_index(index_path.string(), test_log());
    CHECK(loaded.status_info.code == error_code::format_error);
  }

  SUBCASE("missing file") {
    remove_files({index_path});
    auto loaded = lzx::index::load_block_index(index_path.string(), test_log());
    CHECK(loaded.status_info.code == error_code::io_error);
  }

  remove_files({index_path});
}

TEST_CASE("evaluate classifies index freshness") {
  fs::path source = temp_path("lzx_index_evaluate.lzo");
  fs::path index_path = source.string() + ".index";
  remove_files({source, index_path});
  write_file(source, make_archive());

  auto built = lzx::index::create_block_index(source.string(), {}, test_log());
  REQUIRE(built.ok());
  std::string error;

  SUBCASE("current") {
    CHECK(lzx::index::evaluate_block_index(source, index_path, built.value, {}, error) == block_index_status::ok);
    CHECK(error.empty());
  }

  SUBCASE("stale") {
    fs::last_write_time(index_path, fs::last_write_time(source) - std::chrono::hours(1));
    CHECK(lzx::index::evaluate_block_index(source, index_path, built.value, {}, error) == block_index_status::stale);
  }

  SUBCASE("wrong offsets") {
    auto shifted = built.value;
    shifted.offsets[1] += 4;
    CHECK(
        lzx::index::evaluate_block_index(source, index_path, shifted, {}, error) == block_index_status::incompatible
    );
    CHECK_FALSE(error.empty());
  }

  SUBCASE("empty index for a non-empty source") {
    lzx::index::block_index empty;
    CHECK(lzx::index::evaluate_block_index(source, index_path, empty, {}, error) == block_index_status::incompatible);
  }

  SUBCASE("missing source") {
    remove_files({source});
    CHECK(
        lzx::index::evaluate_block_index(source, index_path, built.value, {}, error) == block_index_status::missing
    );
  }

  remove_files({source, index_path});
}

TEST_CASE("ensure reuses current indexes and rebuilds stale ones") {
  fs::path source = temp_path("lzx_index_ensure.lzo");
  fs::path index_path = source.string() + ".index";
  remove_files({source, index_path});

  std::vector<uint64_t> expected;
  write_file(source, make_archive(&expected));

  SUBCASE("missing index without build permission") {
    block_index_options options;
    options.allow_build = false;
    auto ensured = lzx::index::ensure_block_index(source.string(), options, test_log());
    CHECK_FALSE(ensured.ok());
    CHECK_FALSE(fs::exists(index_path));
  }

  SUBCASE("missing index is built") {
    auto ensured = lzx::index::ensure_block_index(source.string(), {}, test_log());
    REQUIRE(ensured.ok());
    CHECK(ensured.value.offsets == expected);
    CHECK(fs::exists(index_path));
  }

  SUBCASE("bogus index is replaced") {
    write_file(index_path, encode_offsets({1, 2, 3}));
    auto ensured = lzx::index::ensure_block_index(source.string(), {}, test_log());
    REQUIRE(ensured.ok());
    CHECK(read_file(index_path) == encode_offsets(expected));
  }

  SUBCASE("stale index is rebuilt") {
    REQUIRE(lzx::index::create_block_index(source.string(), {}, test_log()).ok());
    fs::last_write_time(index_path, fs::last_write_time(source) - std::chrono::hours(1));
    auto ensured = lzx::index::ensure_block_index(source.string(), {}, test_log());
    REQUIRE(ensured.ok());
    CHECK(ensured.value.header.has_value());
  }

  SUBCASE("current index is loaded") {
    REQUIRE(lzx::index::create_block_index(source.string(), {}, test_log()).ok());
    fs::last_write_time(index_path, fs::last_write_time(source) + std::chrono::hours(1));
    auto ensured = lzx::index::ensure_block_index(source.string(), {}, test_log());
    REQUIRE(ensured.ok());
    CHECK(ensured.value.offsets == expected);
    CHECK_FALSE(ensured.value.header.has_value());
  }

  remove_files({source, index_path});
}

TEST_CASE("an index missing trailing blocks is rebuilt") {
  fs::path source = temp_path("lzx_index_truncated.lzo");
  fs::path index_path = source.string() + ".index";
  remove_files({source, index_path});

  auto bytes = build_header(header_spec{});
  uint64_t first = append_block(bytes, 128, 128, 0);
  uint64_t second = append_block(bytes, 128, 128, 0);
  append_sentinel(bytes);
  write_file(source, bytes);

  auto built = lzx::index::create_block_index(source.string(), {}, test_log());
  REQUIRE(built.ok());
  REQUIRE(built.value.size() == 2);

  write_file(index_path, encode_offsets({first}));
  fs::last_write_time(index_path, fs::last_write_time(source) + std::chrono::hours(1));

  auto loaded = lzx::index::load_block_index(index_path.string(), test_log());
  REQUIRE(loaded.ok());
  std::string error;
  CHECK(
      lzx::index::evaluate_block_index(source, index_path, loaded.value, {}, error) == block_index_status::incompatible
  );
  CHECK_FALSE(error.empty());

  std::vector<uint64_t> all_blocks = {first, second};
  auto ensured = lzx::index::ensure_block_index(source.string(), {}, test_log());
  REQUIRE(ensured.ok());
  CHECK(ensured.value.offsets == all_blocks);
  CHECK(read_file(index_path) == encode_offsets(all_blocks));

  remove_files({source, index_path});
}

TEST_CASE("an index listing extra blocks is incompatible") {
  fs::path source = temp_path("lzx_index_extra.lzo");
  fs::path index_path = source.string() + ".index";
  remove_files({source, index_path});

  std::vector<uint64_t> expected;
  write_file(source, make_archive(&expected));
  REQUIRE(lzx::index::create_block_index(source.string(), {}, test_log()).ok());

  lzx::index::block_index extended;
  extended.offsets = expected;
  extended.offsets.push_back(expected.back() + 64);
  std::string error;
  CHECK(
      lzx::index::evaluate_block_index(source, index_path, extended, {}, error) == block_index_status::incompatible
  );

  remove_files({source, index_path});
}

TEST_CASE("index options read the environment") {
  lzx::util::env_config env("LZXTEST_INDEX");

  ::setenv("LZXTEST_INDEX_VERSION_GATE", "Library", 1);
  ::setenv("LZXTEST_INDEX_FORCE_REBUILD", "yes", 1);
  auto options = lzx::index::load_block_index_options(env);
  CHECK(options.header.gate == lzx::index::version_gate::library);
  CHECK(options.force_rebuild);

  ::setenv("LZXTEST_INDEX_VERSION_GATE", "bogus", 1);
  ::unsetenv("LZXTEST_INDEX_FORCE_REBUILD");
  options = lzx::index::load_block_index_options(env);
  CHECK(options.header.gate == lzx::index::version_gate::declared);
  CHECK_FALSE(options.force_rebuild);

  ::unsetenv("LZXTEST_INDEX_VERSION_GATE");
}

TEST_CASE("default index path appends the index suffix") {
  CHECK(lzx::index::default_block_index_path("/data/archive.lzo") == "/data/archive.lzo.index");
}
