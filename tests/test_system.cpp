#include <catch2/catch.hpp>

#include "test_helpers.hpp"
#include "vidcut/system.hpp"

using namespace vidcut;
using namespace vidcut::testing;

TEST_CASE("Command-line times", "[system]") {
  CHECK(parse_time("90").value() == Approx(90.0));
  CHECK(parse_time("12.5").value() == Approx(12.5));
  CHECK(parse_time("01:30").value() == Approx(90.0));
  CHECK(parse_time("1:02:03.250").value() == Approx(3723.25));

  CHECK_FALSE(parse_time(""));
  CHECK_FALSE(parse_time("-5"));
  CHECK_FALSE(parse_time("1:75"));
  CHECK_FALSE(parse_time("1:2:3:4"));
  CHECK_FALSE(parse_time("ten"));
  CHECK_FALSE(parse_time("1.5:10"));
}

TEST_CASE("Time and ETA formatting", "[system]") {
  CHECK(format_time(0) == "00:00:00");
  CHECK(format_time(3723.9) == "01:02:03");
  CHECK(format_time(-4) == "00:00:00");

  CHECK(format_eta(0) == "0s");
  CHECK(format_eta(42.2) == "42s");
  CHECK(format_eta(185) == "3m 05s");
  CHECK(format_eta(3720) == "1h 02m");
}

TEST_CASE("Output file helpers", "[system]") {
  ScratchDir dir;
  std::string out = dir.file("clip.mp4");

  CHECK_FALSE(is_nonempty_file(out));
  write_file(out, "");
  CHECK_FALSE(is_nonempty_file(out));
  write_file(out, "data");
  CHECK(is_nonempty_file(out));

  CHECK(remove_partial_output(out));
  CHECK_FALSE(fs::exists(out));
  /// Nothing to remove is not an error
  CHECK(remove_partial_output(out));

  CHECK(subtitle_path_for("/out/talk_cut.mp4") == "/out/talk_cut.srt");
  CHECK(subtitle_path_for("clip") == "clip.srt");
}

TEST_CASE("CPU limit is within bounds", "[system]") {
  int n = detect_cpu_limit();
  CHECK(n >= 1);
  CHECK(n <= 64);
}
