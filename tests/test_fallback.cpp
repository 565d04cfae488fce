#include "test_common.h"
#include "mediafetch/chunked_downloader.hpp"

using namespace mediafetch;

static DownloadRequest make_request(const TempDir &dir) {
    DownloadRequest request;
    request.url = "https://media.example.org/stream.mp4";
    request.destination = dir.file("stream.mp4");
    request.headers = {{"user-agent", "test-agent"}};
    request.cookies = {{"token", "t"}};
    request.chunk_size = 1024 * 1024;
    return request;
}

// Probe 404 without size headers: exactly one unranged GET
static int test_probe_404_runs_fallback_once() {
    TempDir dir("fallback_404");
    std::string payload = make_payload(3 * 1024 * 1024 + 17);
    FakeHttpClient client(payload);
    client.probe_status = 404;
    client.probe_content_range = false;
    client.probe_content_length = false;
    RecordingSink sink;
    ChunkedDownloader downloader(client, &sink);

    DownloadRequest request = make_request(dir);
    if (downloader.downloadWithResume(request) != FetchStatus::CompleteFallback) return fail(66, "expected fallback");
    if (client.transfer_count != 1) return fail(67, "fallback must run exactly once");

    const HttpRequest *fallback = nullptr;
    for (const auto &sent : client.requests)
        if (!sent.headers_only) fallback = &sent;
    if (!fallback) return fail(68, "no fallback request recorded");
    if (fallback->headers.count("Range") != 0) return fail(69, "fallback must not send a Range header");
    if (fallback->headers.count("user-agent") != 1 || fallback->cookies.count("token") != 1) return fail(70, "caller headers/cookies dropped");
    if (fallback->buffer_size != DEFAULT_FALLBACK_BUFFER_SIZE) return fail(71, "fallback buffer size");

    if (read_file(request.destination) != payload) return fail(72, "fallback content differs");
    if (!sink.events.empty()) return fail(73, "fallback reports no chunk progress");
    if (!sink.logged("Using fallback download method")) return fail(74, "fallback not logged");
    return 0;
}

static int test_fallback_truncates_partial_content() {
    TempDir dir("fallback_truncate");
    std::string payload = make_payload(1000);
    FakeHttpClient client(payload);
    client.probe_status = 403;
    RecordingSink sink;
    ChunkedDownloader downloader(client, &sink);

    DownloadRequest request = make_request(dir);
    write_file(request.destination, std::string(5000, 'J'));
    if (downloader.downloadWithResume(request) != FetchStatus::CompleteFallback) return fail(75, "expected fallback");
    if (read_file(request.destination) != payload) return fail(76, "old bytes survived the fallback");
    return 0;
}

static int test_probe_network_error_falls_back() {
    TempDir dir("fallback_net");
    std::string payload = make_payload(4096);
    FakeHttpClient client(payload);
    client.probe_network_error = true;
    RecordingSink sink;
    ChunkedDownloader downloader(client, &sink);

    DownloadRequest request = make_request(dir);
    if (downloader.downloadWithResume(request) != FetchStatus::CompleteFallback) return fail(77, "expected fallback");
    if (read_file(request.destination) != payload) return fail(78, "content differs");
    return 0;
}

static int test_fallback_failure_is_terminal() {
    TempDir dir("fallback_fail");
    FakeHttpClient client(make_payload(4096));
    client.probe_status = 404;
    client.scripted_statuses = {500};
    RecordingSink sink;
    ChunkedDownloader downloader(client, &sink);

    if (downloader.downloadWithResume(make_request(dir)) != FetchStatus::Failed) return fail(79, "expected Failed");
    if (downloader.lastError().find("Fallback download failed") != 0) return fail(80, "error: " + downloader.lastError());
    if (client.transfer_count != 1) return fail(81, "no second fallback attempt");

    FakeHttpClient broken(make_payload(4096));
    broken.probe_status = 404;
    broken.network_error_at = 0;
    ChunkedDownloader second(broken, &sink);
    if (second.downloadWithResume(make_request(dir)) != FetchStatus::Failed) return fail(82, "network error in fallback must fail");
    return 0;
}

int main() {
    int rc = 0;
    if ((rc = test_probe_404_runs_fallback_once())) return rc;
    if ((rc = test_fallback_truncates_partial_content())) return rc;
    if ((rc = test_probe_network_error_falls_back())) return rc;
    if ((rc = test_fallback_failure_is_terminal())) return rc;
    std::cout << "[TEST] OK fallback" << std::endl;
    return 0;
}
