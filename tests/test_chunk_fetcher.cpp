#include "test_common.h"
#include "mediafetch/chunked_downloader.hpp"
#include <atomic>

using namespace mediafetch;

static const size_t MiB = 1024 * 1024;

static DownloaderOptions quick_options() {
    DownloaderOptions options;
    options.forbidden_retry_delay = std::chrono::milliseconds(0);
    return options;
}

static DownloadRequest make_request(const TempDir &dir, size_t chunk_size) {
    DownloadRequest request;
    request.url = "https://media.example.org/seminar.mp4";
    request.destination = dir.file("seminar.mp4");
    request.headers = {{"referer", "https://example.org/"}};
    request.cookies = {{"session", "s1"}};
    request.chunk_size = chunk_size;
    return request;
}

static size_t range_length(const std::string &header) {
    size_t eq = header.find('='), dash = header.find('-');
    size_t start = std::stoull(header.substr(eq + 1, dash - eq - 1));
    size_t end = std::stoull(header.substr(dash + 1));
    return end - start + 1;
}

static int test_ten_mib_in_four_mib_chunks() {
    TempDir dir("chunks_basic");
    std::string payload = make_payload(10 * MiB);
    FakeHttpClient client(payload);
    RecordingSink sink;
    ChunkedDownloader downloader(client, &sink, quick_options());

    DownloadRequest request = make_request(dir, 4 * MiB);
    if (downloader.downloadWithResume(request) != FetchStatus::Complete) return fail(66, downloader.lastError());

    auto ranges = client.transfer_ranges();
    std::vector<std::string> expected = {"bytes=0-4194303", "bytes=4194304-8388607", "bytes=8388608-10485759"};
    if (ranges != expected) return fail(67, "unexpected range sequence");

    size_t sum = 0;
    for (const auto &r : ranges) sum += range_length(r);
    if (sum != payload.size()) return fail(68, "range lengths must add up to the total");

    if (read_file(request.destination) != payload) return fail(69, "file content differs");

    if (sink.events.size() != 3) return fail(70, "one progress event per chunk");
    size_t currents[] = {4194304, 8388608, 10485760};
    for (size_t i = 0; i < 3; ++i) {
        if (sink.events[i].current != currents[i] || sink.events[i].total != 10485760) return fail(71, "progress values");
        if (sink.events[i].stage != "download") return fail(72, "stage tag");
    }
    if (sink.events[2].message.find("Downloaded 10,485,760/10,485,760 bytes (100.0%)") != 0)
        return fail(73, "progress message: " + sink.events[2].message);

    for (const auto &sent : client.requests) {
        if (sent.headers_only) continue;
        if (sent.headers.count("referer") != 1 || sent.cookies.count("session") != 1) return fail(74, "headers/cookies not carried");
        if (sent.buffer_size != DEFAULT_READ_BUFFER_SIZE) return fail(75, "read buffer must stay independent of chunk size");
    }
    return 0;
}

static int test_forbidden_is_retried_in_place() {
    TempDir dir("chunks_403");
    std::string payload = make_payload(10 * MiB);
    FakeHttpClient client(payload);
    client.scripted_statuses = {403, 403, 403};
    RecordingSink sink;
    ChunkedDownloader downloader(client, &sink, quick_options());

    DownloadRequest request = make_request(dir, 4 * MiB);
    if (downloader.downloadWithResume(request) != FetchStatus::Complete) return fail(76, downloader.lastError());

    auto ranges = client.transfer_ranges();
    if (ranges.size() != 6) return fail(77, "3 refused + 3 served requests expected, got " + std::to_string(ranges.size()));
    for (size_t i = 0; i < 4; ++i)
        if (ranges[i] != "bytes=0-4194303") return fail(78, "403 must not advance the range");
    if (sink.events.size() != 3 || sink.events[0].current != 4194304) return fail(79, "no progress during 403s");
    if (!sink.logged("Access forbidden (403)")) return fail(80, "403 warning missing");
    if (read_file(request.destination) != payload) return fail(81, "content differs after retries");
    return 0;
}

static int test_forbidden_retry_cap() {
    TempDir dir("chunks_403_cap");
    FakeHttpClient client(make_payload(2 * MiB));
    client.scripted_statuses = std::deque<long>(20, 403);
    RecordingSink sink;
    DownloaderOptions options = quick_options();
    options.max_forbidden_retries = 2;
    ChunkedDownloader downloader(client, &sink, options);

    DownloadRequest request = make_request(dir, MiB);
    try {
        downloader.fetchChunks(request, 2 * MiB);
        return fail(82, "exhausted 403 retries must throw");
    } catch (const FatalHttpError &ex) {
        if (ex.status() != 403) return fail(83, "status carried by FatalHttpError");
    }
    if (client.transfer_count != 3) return fail(84, "1 attempt + 2 retries expected, got " + std::to_string(client.transfer_count));

    // Through the top-level path the failure is reported without a fallback
    FakeHttpClient again(make_payload(2 * MiB));
    again.scripted_statuses = std::deque<long>(20, 403);
    ChunkedDownloader second(again, &sink, options);
    if (second.downloadWithResume(make_request(dir, MiB)) != FetchStatus::Failed) return fail(85, "expected Failed");
    if (again.transfer_count != 3) return fail(86, "no fallback request after HTTP failure");
    return 0;
}

static int test_unexpected_status_aborts() {
    TempDir dir("chunks_500");
    std::string payload = make_payload(3 * MiB);
    FakeHttpClient client(payload);
    client.scripted_statuses = {206, 500};
    RecordingSink sink;
    ChunkedDownloader downloader(client, &sink, quick_options());

    DownloadRequest request = make_request(dir, MiB);
    if (downloader.downloadWithResume(request) != FetchStatus::Failed) return fail(87, "500 must fail the download");
    if (downloader.lastError().find("500") == std::string::npos) return fail(88, "status missing from error");
    if (bytes_on_disk(request.destination) != MiB) return fail(89, "first chunk must stay on disk for resume");

    // Caller opted into the fallback for HTTP errors
    FakeHttpClient other(payload);
    other.scripted_statuses = {500};
    DownloaderOptions options = quick_options();
    options.fallback_on_http_error = true;
    ChunkedDownloader lenient(other, &sink, options);
    if (lenient.downloadWithResume(make_request(dir, MiB)) != FetchStatus::CompleteFallback)
        return fail(90, "fallback_on_http_error must run the fallback");
    if (read_file(request.destination) != payload) return fail(105, "fallback must rewrite the partial file");
    return 0;
}

static int test_short_reads_keep_offsets_contiguous() {
    TempDir dir("chunks_short");
    std::string payload = make_payload(10 * MiB);
    FakeHttpClient client(payload);
    client.max_bytes_per_response = 3 * MiB;
    RecordingSink sink;
    ChunkedDownloader downloader(client, &sink, quick_options());

    DownloadRequest request = make_request(dir, 4 * MiB);
    if (downloader.downloadWithResume(request) != FetchStatus::Complete) return fail(91, downloader.lastError());
    if (read_file(request.destination) != payload) return fail(92, "short reads corrupted the file");

    auto ranges = client.transfer_ranges();
    if (ranges.size() < 2 || ranges[1] != "bytes=3145728-7340031") return fail(93, "next range must start at the bytes actually written");
    for (size_t i = 1; i < sink.events.size(); ++i)
        if (sink.events[i].current <= sink.events[i - 1].current) return fail(94, "progress must be monotonic");
    return 0;
}

static int test_server_sending_too_much_is_clamped() {
    TempDir dir("chunks_clamp");
    std::string payload = make_payload(4 * MiB);
    FakeHttpClient client(payload);
    client.ignore_ranges = true;
    RecordingSink sink;
    ChunkedDownloader downloader(client, &sink, quick_options());

    DownloadRequest request = make_request(dir, 4 * MiB);
    size_t on_disk = downloader.fetchChunks(request, MiB);
    if (on_disk != MiB || bytes_on_disk(request.destination) != MiB) return fail(95, "write past the requested span");
    return 0;
}

static int test_network_error_mid_loop_falls_back() {
    TempDir dir("chunks_net");
    std::string payload = make_payload(5 * MiB);
    FakeHttpClient client(payload);
    client.network_error_at = 1;
    RecordingSink sink;
    ChunkedDownloader downloader(client, &sink, quick_options());

    DownloadRequest request = make_request(dir, 2 * MiB);
    if (downloader.downloadWithResume(request) != FetchStatus::CompleteFallback) return fail(96, "expected fallback");
    auto ranges = client.transfer_ranges();
    if (ranges.back() != "") return fail(97, "fallback request must be unranged");
    if (read_file(request.destination) != payload) return fail(98, "fallback content differs");
    return 0;
}

// Cancels from inside the sink, i.e. between two chunks
class CancellingSink : public RecordingSink {
public:
    explicit CancellingSink(std::atomic<bool> &flag) : flag_(flag) {}
    void progress(const ProgressEvent &event) override {
        RecordingSink::progress(event);
        flag_ = true;
    }

private:
    std::atomic<bool> &flag_;
};

static int test_cancellation_at_chunk_boundary() {
    TempDir dir("chunks_cancel");
    std::string payload = make_payload(10 * MiB);
    FakeHttpClient client(payload);
    std::atomic<bool> cancelled{false};
    CancellingSink sink(cancelled);
    DownloaderOptions options = quick_options();
    options.cancelled = &cancelled;
    ChunkedDownloader downloader(client, &sink, options);

    DownloadRequest request = make_request(dir, 4 * MiB);
    if (downloader.downloadWithResume(request) != FetchStatus::Cancelled) return fail(99, "expected Cancelled");
    if (bytes_on_disk(request.destination) != 4 * MiB) return fail(100, "cancel must leave whole chunks only");
    if (client.transfer_count != 1) return fail(101, "no request after cancellation, no fallback");

    // The partial file resumes cleanly
    FakeHttpClient resumed(payload);
    RecordingSink plain;
    ChunkedDownloader again(resumed, &plain, quick_options());
    if (again.downloadWithResume(request) != FetchStatus::Complete) return fail(102, again.lastError());
    if (resumed.transfer_count != 2) return fail(103, "resume after cancel must fetch the 2 remaining chunks");
    if (read_file(request.destination) != payload) return fail(104, "content differs after resume");
    return 0;
}

// A server that drops Range on a resumed download must not have its bytes appended
static int test_ignored_range_on_resume_is_refused() {
    TempDir dir("chunks_ignored_range");
    std::string payload = make_payload(2 * MiB);
    DownloadRequest request = make_request(dir, MiB);
    write_file(request.destination, payload.substr(0, MiB));

    {
        FakeHttpClient client(payload);
        client.ignore_ranges = true;
        RecordingSink sink;
        ChunkedDownloader downloader(client, &sink, quick_options());
        bool refused = false;
        try {
            downloader.fetchChunks(request, payload.size());
        } catch (const NetworkError &) {
            refused = true;
        }
        if (!refused) return fail(220, "200 for a range past byte 0 must be refused");
        if (read_file(request.destination) != payload.substr(0, MiB)) return fail(221, "refused body reached the file");
    }
    {
        FakeHttpClient client(payload);
        client.ignore_ranges = true;
        RecordingSink sink;
        ChunkedDownloader downloader(client, &sink, quick_options());
        if (downloader.downloadWithResume(request) != FetchStatus::CompleteFallback) return fail(222, "expected the fallback");
        if (read_file(request.destination) != payload) return fail(223, "fallback content differs");
    }
    return 0;
}

static int test_misplaced_content_range_is_refused() {
    TempDir dir("chunks_misplaced");
    std::string payload = make_payload(3 * MiB);
    DownloadRequest request = make_request(dir, MiB);
    write_file(request.destination, payload.substr(0, MiB));

    FakeHttpClient client(payload);
    client.ranges_restart_at_zero = true;
    RecordingSink sink;
    ChunkedDownloader downloader(client, &sink, quick_options());
    bool refused = false;
    try {
        downloader.fetchChunks(request, payload.size());
    } catch (const NetworkError &) {
        refused = true;
    }
    if (!refused) return fail(224, "206 starting at the wrong offset must be refused");
    if (bytes_on_disk(request.destination) != MiB) return fail(225, "misplaced body reached the file");
    return 0;
}

static int test_range_response_classification() {
    ChunkRange range;
    range.start = 100;
    range.end = 199;

    HttpResponse response;
    response.status = 403;
    try {
        check_range_response(response, range);
        return fail(226, "403 accepted");
    } catch (const TransientHttpError &ex) {
        if (ex.status() != 403) return fail(227, "403 status lost");
    }

    response.status = 500;
    try {
        check_range_response(response, range);
        return fail(228, "500 accepted");
    } catch (const FatalHttpError &ex) {
        if (ex.status() != 500) return fail(229, "500 status lost");
    }

    response.status = 206;
    response.headers["content-range"] = "bytes 100-199/1000";
    check_range_response(response, range);

    response.headers["content-range"] = "bytes 0-99/1000";
    try {
        check_range_response(response, range);
        return fail(230, "misplaced Content-Range accepted");
    } catch (const NetworkError &) {
    }

    response.headers.clear();
    check_range_response(response, range);

    response.status = 200;
    try {
        check_range_response(response, range);
        return fail(231, "200 accepted for a span past byte 0");
    } catch (const NetworkError &) {
    }
    range.start = 0;
    check_range_response(response, range);
    return 0;
}

int main() {
    int rc = 0;
    if ((rc = test_ten_mib_in_four_mib_chunks())) return rc;
    if ((rc = test_forbidden_is_retried_in_place())) return rc;
    if ((rc = test_forbidden_retry_cap())) return rc;
    if ((rc = test_unexpected_status_aborts())) return rc;
    if ((rc = test_short_reads_keep_offsets_contiguous())) return rc;
    if ((rc = test_server_sending_too_much_is_clamped())) return rc;
    if ((rc = test_network_error_mid_loop_falls_back())) return rc;
    if ((rc = test_cancellation_at_chunk_boundary())) return rc;
    if ((rc = test_ignored_range_on_resume_is_refused())) return rc;
    if ((rc = test_misplaced_content_range_is_refused())) return rc;
    if ((rc = test_range_response_classification())) return rc;
    std::cout << "[TEST] OK chunk fetcher" << std::endl;
    return 0;
}
