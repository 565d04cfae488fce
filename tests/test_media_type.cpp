#include "test_common.h"
#include "mediafetch/download_utils.hpp"
#include "mediafetch/post_processor.hpp"
#include <ctime>

using namespace mediafetch;

static int test_classification() {
    const char *audio[] = {"https://a.org/x.mp3", "https://a.org/x.M4A", "https://a.org/x.wav?t=1",
                           "https://a.org/x.aac", "https://a.org/dir/x.flac", "https://a.org/x.ogg#start"};
    for (const char *url : audio)
        if (classify_media_type(url) != MediaType::Audio) return fail(10, std::string("expected audio: ") + url);

    const char *video[] = {"https://a.org/x.mp4", "https://a.org/x.webm", "https://a.org/x.mkv",
                           "https://a.org/stream", "https://a.org/x.mp4?format=mp3", "https://a.org/mp3"};
    for (const char *url : video)
        if (classify_media_type(url) != MediaType::Video) return fail(11, std::string("expected video: ") + url);

    if (std::string(media_type_name(MediaType::Audio)) != "audio") return fail(12, "audio name");
    if (std::string(media_type_name(MediaType::Video)) != "video") return fail(13, "video name");
    return 0;
}

static int test_filename_extraction() {
    if (url_decode("a%20b%2Fc%zz+") != "a b/c%zz+") return fail(14, "url_decode: " + url_decode("a%20b%2Fc%zz+"));
    if (extract_filename_from_url("https://a.org/v/My%20Talk.mp4?sig=abc") != "My Talk.mp4") return fail(15, "decoded name");
    if (!extract_filename_from_url("https://a.org").empty()) return fail(16, "bare host has no name");
    if (!extract_filename_from_url("https://a.org/dir/").empty()) return fail(17, "trailing slash has no name");
    if (!extract_filename_from_url("https://a.org/%2E%2E").empty()) return fail(18, "dot-dot rejected");
    if (!extract_filename_from_url("https://a.org/a%2Fb.mp4").empty()) return fail(19, "encoded slash rejected");
    return 0;
}

static int test_output_paths() {
    TempDir dir("media_type_paths");
    std::string out = dir.file("nested/out");

    std::tm fixed{};
    fixed.tm_year = 2024 - 1900;
    fixed.tm_mon = 2;
    fixed.tm_mday = 9;
    fixed.tm_hour = 14;
    fixed.tm_min = 5;
    fixed.tm_sec = 7;
    fixed.tm_isdst = -1;
    auto when = std::chrono::system_clock::from_time_t(std::mktime(&fixed));

    std::string p1 = generate_output_path("https://a.org/lecture.mp4?x=1", MediaType::Video, out, true, when);
    if (std::filesystem::path(p1).filename() != "lecture_20240309_140507.mp4") return fail(20, "named: " + p1);
    if (!std::filesystem::is_directory(out)) return fail(21, "output dir must be created");

    std::string p2 = generate_output_path("https://a.org/", MediaType::Audio, out, true, when);
    if (std::filesystem::path(p2).filename() != "audio_20240309_140507.mp3") return fail(22, "audio default: " + p2);

    std::string p3 = generate_output_path("https://a.org", MediaType::Video, out, true, when);
    if (std::filesystem::path(p3).filename() != "video_20240309_140507.mp4") return fail(23, "video default: " + p3);

    std::string p4 = generate_output_path("https://a.org/song.mp3", MediaType::Audio, out, false, when);
    if (std::filesystem::path(p4).filename() != "song.mp3") return fail(24, "untimestamped: " + p4);
    return 0;
}

static int test_validation() {
    std::string error;
    if (!validate_url("  https://example.org/a.mp4 ", error)) return fail(25, "trimmed URL rejected: " + error);
    if (validate_url("", error) || error.empty()) return fail(26, "empty URL accepted");
    if (validate_url("example.org/a.mp4", error)) return fail(27, "missing scheme accepted");
    if (validate_url("ftp://example.org/a.mp4", error)) return fail(28, "ftp accepted");
    if (validate_url("https://", error)) return fail(29, "missing host accepted");

    TempDir dir("media_type_validate");
    std::string created = dir.file("made/here");
    if (!validate_directory(created, error) || !std::filesystem::is_directory(created)) return fail(30, "directory not created");
    write_file(dir.file("plain.txt"), "x");
    if (validate_directory(dir.file("plain.txt"), error)) return fail(31, "file accepted as directory");
    if (!validate_file_exists(dir.file("plain.txt"), error)) return fail(32, "existing file rejected");
    if (validate_file_exists(dir.file("missing.json"), error)) return fail(33, "missing file accepted");
    if (validate_file_exists(dir.path.string(), error)) return fail(34, "directory accepted as file");
    return 0;
}

static int test_faststart_command() {
    if (shell_quote("it's") != "'it'\\''s'") return fail(35, "quote: " + shell_quote("it's"));

    FfmpegFaststart ffmpeg("/opt/ffmpeg/bin/ffmpeg");
    std::string fixed = ffmpeg.outputPathFor("/data/dump/talk_20240309_140507.webm");
    if (fixed != "/data/dump/talk_20240309_140507_fixed.mp4") return fail(36, "fixed path: " + fixed);

    std::string cmd = ffmpeg.buildCommand("/d/in put.mp4", "/d/out.mp4");
    if (cmd != "'/opt/ffmpeg/bin/ffmpeg' -y -i '/d/in put.mp4' -c copy -movflags faststart '/d/out.mp4' 2>&1")
        return fail(37, "command: " + cmd);

    // A missing binary is reported, never thrown
    FfmpegFaststart missing("/nonexistent/ffmpeg-binary");
    TempDir dir("media_type_ffmpeg");
    write_file(dir.file("in.mp4"), "not really a video");
    std::string error;
    if (missing.process(dir.file("in.mp4"), dir.file("in_fixed.mp4"), error)) return fail(38, "missing ffmpeg succeeded");
    if (error.empty()) return fail(39, "missing ffmpeg gave no error");
    return 0;
}

int main() {
    int rc = 0;
    if ((rc = test_classification())) return rc;
    if ((rc = test_filename_extraction())) return rc;
    if ((rc = test_output_paths())) return rc;
    if ((rc = test_validation())) return rc;
    if ((rc = test_faststart_command())) return rc;
    std::cout << "[TEST] OK media type and naming" << std::endl;
    return 0;
}
