/**
 * @file test_config.cpp
 * @brief Tests for config::Loader parsing and the config-bound mem::Allocator.
 */
#include <gtest/gtest.h>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <string>

#include "zeroalloc/config/config_loader.hpp"
#include "zeroalloc/config/constants.hpp"
#include "zeroalloc/mem/allocator.hpp"
#include "zeroalloc/obs/observability.hpp"

using zeroalloc::config::AllocConfig;
using zeroalloc::config::ConfigError;
using zeroalloc::config::Loader;
using zeroalloc::mem::AllocError;
using zeroalloc::mem::Allocator;
namespace constants = zeroalloc::config::constants;

// ---------- Loader ----------

TEST(Loader, Defaults_FromConstants) {
  const auto cfg = Loader::defaults();
  EXPECT_EQ(cfg.alignment, constants::DEFAULT_ALIGNMENT);
  EXPECT_EQ(cfg.max_bytes, constants::DEFAULT_MAX_BYTES);
  EXPECT_EQ(cfg.verbose, constants::DEFAULT_VERBOSE);
}

TEST(Loader, Parse_AllKeys_CommentsAndBlanks) {
  auto cfg = Loader::parse(
    "# allocation settings\n"
    "\n"
    "alignment = 64\n"
    "  max_bytes=4096   # per request\n"
    "verbose = true\r\n");
  ASSERT_TRUE(cfg);
  EXPECT_EQ(cfg->alignment, 64u);
  EXPECT_EQ(cfg->max_bytes, 4096u);
  EXPECT_TRUE(cfg->verbose);
}

TEST(Loader, Parse_UnsetKeysKeepDefaults) {
  auto cfg = Loader::parse("max_bytes = \"unlimited\"\n");
  ASSERT_TRUE(cfg);
  EXPECT_EQ(cfg->alignment, constants::DEFAULT_ALIGNMENT);
  EXPECT_EQ(cfg->max_bytes, constants::DEFAULT_MAX_BYTES);

  auto empty = Loader::parse("");
  ASSERT_TRUE(empty);
  EXPECT_EQ(empty->max_bytes, constants::DEFAULT_MAX_BYTES);
}

TEST(Loader, Parse_SyntaxError_ReportsLine) {
  auto syntax = Loader::parse("alignment = 16\nthis line has no equals\n");
  ASSERT_FALSE(syntax.has_value());
  EXPECT_EQ(syntax.error().error, ConfigError::Syntax);
  EXPECT_EQ(syntax.error().line, 2u);
  EXPECT_FALSE(syntax.error().detail.empty());

  auto dup = Loader::parse("verbose = true\nverbose = false\n");
  ASSERT_FALSE(dup.has_value());
  EXPECT_EQ(dup.error().error, ConfigError::Syntax);
}

TEST(Loader, Parse_UnknownKey) {
  auto unknown = Loader::parse("alignment = 8\n\ncolour = \"blue\"\n");
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error().error, ConfigError::UnknownKey);
  EXPECT_EQ(unknown.error().detail, "colour");
  EXPECT_EQ(unknown.error().line, 3u);

  auto table = Loader::parse("[limits]\nmax_bytes = 10\n");
  ASSERT_FALSE(table.has_value());
  EXPECT_EQ(table.error().error, ConfigError::UnknownKey);
  EXPECT_EQ(table.error().detail, "limits");
}

TEST(Loader, Parse_BadValues) {
  const char* cases[] = {
    "alignment = 48\n",          // not a power of two
    "alignment = 8192\n",        // above MAX_ALIGNMENT
    "alignment = \"64\"\n",      // wrong type
    "max_bytes = -5\n",          // negative
    "max_bytes = 1.5\n",         // not an integer
    "max_bytes = \"lots\"\n",    // only "unlimited" is accepted
    "verbose = 1\n",             // booleans only
  };
  for (const char* text : cases) {
    auto r = Loader::parse(text);
    ASSERT_FALSE(r.has_value()) << text;
    EXPECT_EQ(r.error().error, ConfigError::BadValue) << text;
    EXPECT_EQ(r.error().line, 1u) << text;
  }
}

TEST(Loader, LoadFromFile_RoundsThroughDisk) {
  const std::string path = ::testing::TempDir() + "zeroalloc_test.conf";
  {
    std::ofstream out(path);
    out << "alignment = 128\nmax_bytes = 65536\n";
  }
  auto cfg = Loader::load_from_file(path);
  ASSERT_TRUE(cfg);
  EXPECT_EQ(cfg->alignment, 128u);
  EXPECT_EQ(cfg->max_bytes, 65536u);
  std::remove(path.c_str());

  auto missing = Loader::load_from_file(path);
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().error, ConfigError::FileNotFound);
  EXPECT_EQ(missing.error().detail, path);
}

// ---------- Allocator ----------

TEST(Allocator, AppliesAlignmentAndCap) {
  AllocConfig cfg;
  cfg.alignment = 256;
  cfg.max_bytes = 1024;
  auto obs = zeroalloc::obs::make_counting_observer(false);
  Allocator alloc(cfg, obs.get());

  auto r = alloc.allocate(100, 4);
  ASSERT_TRUE(r);
  EXPECT_EQ(reinterpret_cast<std::uintptr_t>(r->data) % 256, 0u);
  EXPECT_TRUE(zeroalloc::mem::is_all_zero(r->data, r->bytes));

  auto over = alloc.allocate(1025, 1);
  ASSERT_FALSE(over.has_value());
  EXPECT_EQ(over.error(), AllocError::LimitExceeded);

  alloc.release(*r);
  auto snap = obs->snapshot();
  EXPECT_EQ(snap.allocations, 1u);
  EXPECT_EQ(snap.releases, 1u);
  EXPECT_EQ(snap.failures, 1u);
}

TEST(Allocator, MakeBuffer_UsesConfig) {
  AllocConfig cfg;
  cfg.alignment = 64;
  cfg.max_bytes = 64 * sizeof(double);
  auto obs = zeroalloc::obs::make_counting_observer(false);
  Allocator alloc(cfg, obs.get());

  {
    auto b = alloc.make_buffer<double>(64);
    ASSERT_TRUE(b);
    EXPECT_EQ(reinterpret_cast<std::uintptr_t>(b->data()) % 64, 0u);
    for (double v : *b) EXPECT_EQ(v, 0.0);

    auto r = b->resize(65);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), AllocError::LimitExceeded);
  }
  auto snap = obs->snapshot();
  EXPECT_EQ(snap.allocations, 1u);
  EXPECT_EQ(snap.releases, 1u);
  EXPECT_EQ(snap.bytes_live, 0u);
}

TEST(Allocator, UpdateConfig) {
  Allocator alloc(Loader::defaults());
  auto ok = alloc.allocate(2048, 1);
  ASSERT_TRUE(ok);
  alloc.release(*ok);

  AllocConfig tight;
  tight.max_bytes = 1024;
  alloc.update_config(tight);
  EXPECT_EQ(alloc.config().max_bytes, 1024u);
  auto rejected = alloc.allocate(2048, 1);
  ASSERT_FALSE(rejected.has_value());
  EXPECT_EQ(rejected.error(), AllocError::LimitExceeded);
}
