#include <catch2/catch.hpp>

#include "vidcut/progress_parser.hpp"

using namespace vidcut;

TEST_CASE("Key/value progress lines", "[progress]") {
  CHECK(parse_progress_line("out_time_us=1500000").value() == Approx(1.5));
  /// out_time_ms carries microseconds as well
  CHECK(parse_progress_line("out_time_ms=1500000").value() == Approx(1.5));
  CHECK(parse_progress_line("out_time=00:01:02.500000").value() ==
        Approx(62.5));
  CHECK(parse_progress_line("  out_time_us=2000000\r").value() ==
        Approx(2.0));
}

TEST_CASE("Lines without a usable time yield nothing", "[progress]") {
  CHECK_FALSE(parse_progress_line(""));
  CHECK_FALSE(parse_progress_line("   "));
  CHECK_FALSE(parse_progress_line("frame=12"));
  CHECK_FALSE(parse_progress_line("progress=continue"));
  CHECK_FALSE(parse_progress_line("out_time=N/A"));
  CHECK_FALSE(parse_progress_line("out_time_us=N/A"));
  CHECK_FALSE(parse_progress_line("out_time_us=12ab"));
  CHECK_FALSE(parse_progress_line("out_time_us="));
  CHECK_FALSE(parse_progress_line("out_time=-00:00:00.040000"));
  CHECK_FALSE(parse_progress_line("out_time=00:00:0"));
  CHECK_FALSE(parse_progress_line("out_time=00:61:00.00"));
  CHECK_FALSE(parse_progress_line("Press [q] to stop"));
}

TEST_CASE("Statistics lines", "[progress]") {
  CHECK(parse_progress_line("frame=  100 fps= 25 q=28.0 size=  256kB "
                            "time=00:00:04.00 bitrate= 524.3kbits/s "
                            "speed=1.0x")
            .value() == Approx(4.0));
  CHECK(parse_progress_line("size=1024kB time=01:00:00.50").value() ==
        Approx(3600.5));

  /// Partial line cut off mid-value
  CHECK_FALSE(parse_progress_line("frame=  100 fps= 25 time=00:00:0"));
  /// "time=" inside another key
  CHECK_FALSE(parse_progress_line("runtime=00:00:05.00 elapsed"));
}

TEST_CASE("Clock values", "[progress]") {
  CHECK(parse_clock("00:00:00").value() == Approx(0.0));
  CHECK(parse_clock("12:34:56.789").value() ==
        Approx(12 * 3600 + 34 * 60 + 56.789));
  CHECK_FALSE(parse_clock("1:2:3"));
  CHECK_FALSE(parse_clock("00:00:60"));
  CHECK_FALSE(parse_clock("00:00:01."));
}

TEST_CASE("Tracker only reports forward progress", "[progress]") {
  ProgressTracker tracker;

  CHECK(tracker.feed("out_time_us=1000000").value() == Approx(1.0));
  CHECK_FALSE(tracker.feed("out_time_us=1000000"));
  CHECK_FALSE(tracker.feed("out_time_us=500000"));
  CHECK_FALSE(tracker.feed("progress=continue"));
  CHECK(tracker.feed("out_time=00:00:02.000000").value() == Approx(2.0));
  CHECK(tracker.last_time() == Approx(2.0));
}

TEST_CASE("ETA estimation", "[progress]") {
  SECTION("unsmoothed") {
    EtaEstimator eta(100.0, 1.0);
    ProgressSample s = eta.update(25.0, 10.0);
    CHECK(s.percent == Approx(0.25));
    CHECK(s.eta_sec == Approx(30.0));
    CHECK(s.source_time == Approx(25.0));

    s = eta.update(50.0, 20.0);
    CHECK(s.eta_sec == Approx(20.0));
  }
  SECTION("smoothed") {
    EtaEstimator eta(100.0, 0.5);
    CHECK(eta.update(25.0, 10.0).eta_sec == Approx(30.0));
    CHECK(eta.update(50.0, 20.0).eta_sec == Approx(25.0));
  }
  SECTION("completion and overshoot") {
    EtaEstimator eta(100.0, 0.3);
    eta.update(50.0, 20.0);
    ProgressSample s = eta.update(120.0, 40.0);
    CHECK(s.percent == Approx(1.0));
    CHECK(s.eta_sec == Approx(0.0));
  }
  SECTION("unknown total") {
    EtaEstimator eta(0.0, 0.3);
    ProgressSample s = eta.update(5.0, 5.0);
    CHECK(s.percent == Approx(0.0));
    CHECK(s.eta_sec >= 0.0);
  }
  SECTION("invalid smoothing disables it") {
    EtaEstimator eta(100.0, 0.0);
    eta.update(25.0, 10.0);
    CHECK(eta.update(50.0, 20.0).eta_sec == Approx(20.0));
  }
}
