#include "catch2/catch_test_macros.hpp"
#include "upd_common/constants.hpp"
#include "upd_mkimg/command_line.hpp"
#include "upd_mkimg/fw_metadata.hpp"
#include <boost/program_options.hpp>
#include <optional>
#include <string>
#include <vector>

namespace bpo = boost::program_options;

namespace {

bpo::variables_map parse(std::vector<char const*> t_args) {
  t_args.insert(t_args.begin(), "upd_mkimg");
  auto cli = updlink::parse_command_line(static_cast<int>(t_args.size()), t_args.data());
  bpo::notify(cli.vm_);
  return cli.vm_;
}

updlink::FwMetadata embedded_app() {
  return updlink::FwMetadata{
    .load_addr_     = 0x1000,
    .hw_type_       = 4,
    .version_major_ = 3,
    .version_minor_ = 7,
    .flags_         = 0x01,
    .name_          = "watchdog",
  };
}

bool contains(std::vector<std::string> const& t_warnings, std::string const& t_text) {
  for (auto const& warning : t_warnings) {
    if (warning.find(t_text) != std::string::npos) {
      return true;
    }
  }

  return false;
}

}  // namespace

TEST_CASE("header parameters come from the command line", "[Command Line]") {
  SECTION("defaults") {
    auto const params = updlink::resolve_params(parse({"in.bin", "out.upd"}), std::nullopt);
    CHECK(params.fw_major_ == updlink::DEFAULT_FW_MAJOR);
    CHECK(params.fw_minor_ == updlink::DEFAULT_FW_MINOR);
    CHECK(params.hw_type_ == 0);
    CHECK(params.bl_ver_min_ == updlink::DEFAULT_BL_VER_MIN);
    CHECK(params.entry_point_ == updlink::DEFAULT_ENTRY_POINT);
  }

  SECTION("explicit values") {
    auto const vm     = parse({"in.bin", "out.upd", "--major", "2", "--minor", "9", "--hw-type", "4", "--bl-ver-min",
                               "3", "--entry", "0x1000"});
    auto const params = updlink::resolve_params(vm, std::nullopt);
    CHECK(params.fw_major_ == 2);
    CHECK(params.fw_minor_ == 9);
    CHECK(params.hw_type_ == 4);
    CHECK(params.bl_ver_min_ == 3);
    CHECK(params.entry_point_ == 0x1000U);
    CHECK(vm["input"].as<std::string>() == "in.bin");
    CHECK(vm["output"].as<std::string>() == "out.upd");
  }

  SECTION("out of range byte is rejected") {
    CHECK_THROWS_AS(parse({"in.bin", "out.upd", "--major", "256"}), bpo::validation_error);
    CHECK_THROWS_AS(parse({"in.bin", "out.upd", "--hw-type=-1"}), bpo::validation_error);
    CHECK_THROWS_AS(parse({"in.bin", "out.upd", "--entry", "0100"}), bpo::validation_error);
  }

  SECTION("output path is required") {
    CHECK_THROWS_AS(parse({"in.bin"}), bpo::required_option);
  }

  SECTION("help does not need positional arguments") {
    auto const cli = updlink::parse_command_line(2, std::vector<char const*>{"upd_mkimg", "--help"}.data());
    CHECK(cli.vm_.count("help") == 1);
  }
}

TEST_CASE("embedded metadata fills defaults only when requested", "[Command Line]") {
  auto const meta = std::optional{embedded_app()};

  SECTION("ignored without --from-metadata") {
    auto const params = updlink::resolve_params(parse({"in.bin", "out.upd"}), meta);
    CHECK(params.fw_major_ == updlink::DEFAULT_FW_MAJOR);
    CHECK(params.fw_minor_ == updlink::DEFAULT_FW_MINOR);
    CHECK(params.hw_type_ == 0);
    CHECK(params.entry_point_ == updlink::DEFAULT_ENTRY_POINT);
  }

  SECTION("used with --from-metadata") {
    auto const params = updlink::resolve_params(parse({"in.bin", "out.upd", "--from-metadata"}), meta);
    CHECK(params.fw_major_ == 3);
    CHECK(params.fw_minor_ == 7);
    CHECK(params.hw_type_ == 4);
    CHECK(params.entry_point_ == 0x1000U);
    CHECK(params.bl_ver_min_ == updlink::DEFAULT_BL_VER_MIN);
  }

  SECTION("explicit option beats the embedded value") {
    auto const vm     = parse({"in.bin", "out.upd", "--from-metadata", "--major", "9", "--entry", "3200"});
    auto const params = updlink::resolve_params(vm, meta);
    CHECK(params.fw_major_ == 9);
    CHECK(params.fw_minor_ == 7);
    CHECK(params.entry_point_ == 3200U);
  }

  SECTION("missing descriptor falls back to the defaults") {
    auto const params = updlink::resolve_params(parse({"in.bin", "out.upd", "--from-metadata"}), std::nullopt);
    CHECK(params.fw_major_ == updlink::DEFAULT_FW_MAJOR);
    CHECK(params.fw_minor_ == updlink::DEFAULT_FW_MINOR);
    CHECK(params.hw_type_ == 0);
    CHECK(params.entry_point_ == updlink::DEFAULT_ENTRY_POINT);
  }
}

TEST_CASE("sanity checks only produce warnings", "[Command Line]") {
  updlink::AppHeaderParams const defaults{};

  SECTION("flash map") {
    CHECK(updlink::check_against_flash_map(4, defaults).empty());
    CHECK(updlink::check_against_flash_map(updlink::BL_APP_MAX_SIZE, defaults).empty());

    auto const too_big = updlink::check_against_flash_map(updlink::BL_APP_MAX_SIZE + 1, defaults);
    REQUIRE(too_big.size() == 1);
    CHECK(contains(too_big, "bootloader accepts at most 13184 bytes"));

    auto moved         = defaults;
    moved.entry_point_ = 0x2000;
    CHECK(contains(updlink::check_against_flash_map(4, moved), "is not the application start address"));
  }

  SECTION("metadata agreeing with the header") {
    auto meta           = embedded_app();
    meta.load_addr_     = updlink::DEFAULT_ENTRY_POINT;
    meta.hw_type_       = 0;
    meta.version_major_ = updlink::DEFAULT_FW_MAJOR;
    meta.version_minor_ = updlink::DEFAULT_FW_MINOR;
    CHECK(updlink::check_against_metadata(meta, defaults).empty());
  }

  SECTION("metadata disagreeing with the header") {
    auto meta   = embedded_app();
    meta.flags_ = 0x00;

    auto const warnings = updlink::check_against_metadata(meta, defaults);
    CHECK(warnings.size() == 4);
    CHECK(contains(warnings, "BOOT firmware"));
    CHECK(contains(warnings, "differs from embedded version 3.7"));
    CHECK(contains(warnings, "differs from embedded hardware type 4"));
    CHECK(contains(warnings, "differs from embedded load address 0x1000"));
  }
}
