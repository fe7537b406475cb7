#include <catch2/catch.hpp>

#include <algorithm>

#include "vidcut/command_builder.hpp"
#include "vidcut/errors.hpp"
#include "vidcut/profile_selector.hpp"

using namespace vidcut;

namespace {

VideoSource make_source(bool audio = true) {
  VideoSource src;
  src.path = "/videos/in put.mp4";
  src.duration = 100.0;
  src.fps = 30.0;
  src.has_audio = audio;
  return src;
}

CutList two_segments() {
  CutList cuts;
  cuts.segments = {{0.0, 10.0}, {20.0, 100.0}};
  return cuts;
}

/// Value following a flag, or empty
std::string arg_after(const std::vector<std::string> &args,
                      const std::string &flag) {
  auto it = std::find(args.begin(), args.end(), flag);
  if (it == args.end() || it + 1 == args.end())
    return "";
  return *(it + 1);
}

} // anonymous namespace

TEST_CASE("Filter graph trims and concatenates in cut-list order",
          "[command]") {
  CHECK(build_filter_graph(two_segments(), true) ==
        "[0:v]trim=start=0.000:end=10.000,setpts=PTS-STARTPTS[v0];"
        "[0:a]atrim=start=0.000:end=10.000,asetpts=PTS-STARTPTS[a0];"
        "[0:v]trim=start=20.000:end=100.000,setpts=PTS-STARTPTS[v1];"
        "[0:a]atrim=start=20.000:end=100.000,asetpts=PTS-STARTPTS[a1];"
        "[v0][a0][v1][a1]concat=n=2:v=1:a=1[v][a]");

  CHECK(build_filter_graph(two_segments(), false) ==
        "[0:v]trim=start=0.000:end=10.000,setpts=PTS-STARTPTS[v0];"
        "[0:v]trim=start=20.000:end=100.000,setpts=PTS-STARTPTS[v1];"
        "[v0][v1]concat=n=2:v=1:a=0[v]");
}

TEST_CASE("Command building is deterministic", "[command]") {
  EncodingProfile p = select_profile(EncoderCapability::Cpu, QualityIntent{});
  CommandSpec a = build_command(make_source(), two_segments(), p, "out.mp4");
  CommandSpec b = build_command(make_source(), two_segments(), p, "out.mp4");

  CHECK(a == b);
  CHECK(render(a) == render(b));
}

TEST_CASE("Software command has the full argument layout", "[command]") {
  EncodingProfile p = select_profile(EncoderCapability::Cpu, QualityIntent{});
  CommandSpec spec = build_command(make_source(), two_segments(), p, "o.mp4");

  const std::vector<std::string> head = {
      "-hide_banner", "-nostdin", "-y",     "-loglevel", "error",
      "-nostats",     "-progress", "pipe:1", "-i", "/videos/in put.mp4",
      "-filter_complex"};
  REQUIRE(spec.args.size() > head.size());
  CHECK(std::equal(head.begin(), head.end(), spec.args.begin()));
  CHECK(arg_after(spec.args, "-filter_complex") == spec.filter_graph);
  CHECK(arg_after(spec.args, "-c:v") == "libx264");
  CHECK(arg_after(spec.args, "-preset") == "slower");
  CHECK(arg_after(spec.args, "-crf") == "16");
  CHECK(arg_after(spec.args, "-maxrate") == "20000k");
  CHECK(arg_after(spec.args, "-bufsize") == "40000k");
  CHECK(arg_after(spec.args, "-pix_fmt") == "yuv420p");
  CHECK(arg_after(spec.args, "-c:a") == "aac");
  CHECK(arg_after(spec.args, "-b:a") == "192k");
  CHECK(spec.args.back() == "o.mp4");
  CHECK(std::count(spec.args.begin(), spec.args.end(), "-map") == 2);

  CHECK(spec.argv().front() == "ffmpeg");
  CHECK(render(spec).find("'/videos/in put.mp4'") != std::string::npos);
}

TEST_CASE("Silent source maps video only", "[command]") {
  EncodingProfile p = select_profile(EncoderCapability::Cpu, QualityIntent{});
  CommandSpec spec =
      build_command(make_source(false), two_segments(), p, "o.mp4");

  CHECK(std::count(spec.args.begin(), spec.args.end(), "-map") == 1);
  CHECK(std::find(spec.args.begin(), spec.args.end(), "-c:a") ==
        spec.args.end());
}

TEST_CASE("Hardware rate-control flags", "[command]") {
  SECTION("NVENC constant quality") {
    auto args = render_video_args(
        select_profile(EncoderCapability::Nvenc, QualityIntent{}));
    CHECK(arg_after(args, "-c:v") == "h264_nvenc");
    CHECK(arg_after(args, "-rc") == "vbr");
    CHECK(arg_after(args, "-cq") == "16");
    CHECK(arg_after(args, "-b:v") == "0");
  }
  SECTION("AMF quality-defined VBR") {
    auto args = render_video_args(
        select_profile(EncoderCapability::Amf, QualityIntent{}));
    CHECK(arg_after(args, "-quality") == "quality");
    CHECK(arg_after(args, "-rc") == "qvbr");
    CHECK(arg_after(args, "-qvbr_quality_level") == "16");
    CHECK(arg_after(args, "-maxrate") == "20000k");
  }
  SECTION("QSV constant quality") {
    auto args = render_video_args(
        select_profile(EncoderCapability::Qsv, QualityIntent{}));
    CHECK(arg_after(args, "-global_quality") == "16");
    CHECK(arg_after(args, "-maxrate") == "20000k");
    CHECK(arg_after(args, "-bufsize") == "40000k");
  }
  SECTION("QSV bitrate cap") {
    QualityIntent intent;
    intent.rate_control = RateControl::BitrateCap;
    intent.bitrate_ceiling = "6M";
    auto args =
        render_video_args(select_profile(EncoderCapability::Qsv, intent));
    CHECK(arg_after(args, "-b:v") == "6M");
    CHECK(arg_after(args, "-bufsize") == "12M");
    CHECK(std::find(args.begin(), args.end(), "-global_quality") ==
          args.end());
  }
}

TEST_CASE("Every default profile caps the bitrate", "[command]") {
  for (auto cap : {EncoderCapability::Cpu, EncoderCapability::Nvenc,
                   EncoderCapability::Amf, EncoderCapability::Qsv}) {
    for (auto codec : {VideoCodec::H264, VideoCodec::Hevc}) {
      QualityIntent intent;
      intent.codec = codec;
      auto args = render_video_args(select_profile(cap, intent));
      INFO(to_string(cap) << " " << to_string(codec));
      CHECK(arg_after(args, "-maxrate") == "20000k");
      CHECK(arg_after(args, "-bufsize") == "40000k");
    }
  }
}

TEST_CASE("Incompatible profiles are rejected", "[command]") {
  EncodingProfile p = select_profile(EncoderCapability::Cpu, QualityIntent{});

  SECTION("codec of another encoder") {
    p.codec = "h264_nvenc";
    CHECK_THROWS_AS(render_video_args(p), ProfileIncompatibleError);
  }
  SECTION("unknown preset") {
    p.preset = "warp-speed";
    CHECK_THROWS_AS(render_video_args(p), ProfileIncompatibleError);
  }
  SECTION("quality factor out of range") {
    p.quality_factor = 52;
    CHECK_THROWS_AS(render_video_args(p), ProfileIncompatibleError);
  }
  SECTION("malformed bitrate") {
    p.bitrate_ceiling = "fast";
    CHECK_THROWS_AS(render_video_args(p), ProfileIncompatibleError);
  }
  SECTION("empty cut-list") {
    CHECK_THROWS_AS(build_command(make_source(), CutList{}, p, "o.mp4"),
                    ProfileIncompatibleError);
  }
}
