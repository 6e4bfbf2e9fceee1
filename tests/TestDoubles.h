#pragma once
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "io/RandomAccessWriter.h"
#include "net/HttpClient.h"

namespace bdmtest {

// In-memory resource served to every FakeHttpClient created from it.
// Knobs are set before the download starts; counters are read afterwards.
class FakeServer {
public:
    explicit FakeServer(std::string content) : data(std::move(content)) {}

    // HEAD behaviour
    long headStatus = 200;
    bool reportLength = true;
    bool headTransportFailure = false;

    // GET behaviour
    bool ignoreRange = false;
    bool rangeTransportFailure = false;
    std::size_t truncateBodyBy = 0;
    std::size_t extraBodyBytes = 0;
    std::deque<long> failingStatuses; // consumed one per GET, before serving
    std::chrono::milliseconds delay{0};
    std::size_t awaitConcurrency = 0; // hold requests until this many are in flight

    std::unique_ptr<HttpClient> makeClient(const std::string& url);
    HttpClientFactory factory() {
        return [this](const std::string& url) { return makeClient(url); };
    }

    bool head(HttpHeadResult& out) {
        std::lock_guard<std::mutex> lock(mtx);
        ++headCount;
        if (headTransportFailure) {
            out.error = "Couldn't connect to server";
            return false;
        }
        out.status = headStatus;
        out.hasContentLength = reportLength;
        out.contentLength = reportLength ? data.size() : 0;
        out.acceptRanges = !ignoreRange;
        return true;
    }

    bool getRange(const std::string& range, HttpRangeResult& out) {
        enter();

        std::unique_lock<std::mutex> lock(mtx);
        ++getCount;
        requestedRanges.push_back(range);
        requestsByThread[std::this_thread::get_id()].push_back(range);

        bool ok = true;
        if (rangeTransportFailure) {
            out.error = "Connection reset by peer";
            ok = false;
        } else if (!failingStatuses.empty()) {
            out.status = failingStatuses.front();
            failingStatuses.pop_front();
        } else if (ignoreRange) {
            out.status = 200;
            out.body.assign(data.begin(), data.end());
        } else {
            serveRange(range, out);
        }
        lock.unlock();

        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        leave();
        return ok;
    }

    std::size_t peakInFlight() const {
        std::lock_guard<std::mutex> lock(mtx);
        return peak;
    }

    const std::string data;

    std::size_t headCount = 0;
    std::size_t getCount = 0;
    std::vector<std::string> requestedRanges;
    std::map<std::thread::id, std::vector<std::string>> requestsByThread;

private:
    void serveRange(const std::string& range, HttpRangeResult& out) {
        // "bytes=<first>-<last>"
        const auto eq = range.find('=');
        const auto dash = range.find('-');
        const std::uint64_t first = std::stoull(range.substr(eq + 1, dash - eq - 1));
        std::uint64_t last = std::stoull(range.substr(dash + 1));

        if (first >= data.size()) {
            out.status = 416;
            return;
        }
        last = std::min<std::uint64_t>(last, data.size() - 1);

        out.status = 206;
        out.body.assign(data.begin() + first, data.begin() + last + 1);
        if (truncateBodyBy > 0) {
            out.body.resize(out.body.size() - std::min(truncateBodyBy, out.body.size()));
        }
        out.body.insert(out.body.end(), extraBodyBytes, 'X');
    }

    void enter() {
        std::unique_lock<std::mutex> lock(mtx);
        ++inFlight;
        peak = std::max(peak, inFlight);
        cv.notify_all();
        if (awaitConcurrency > 0) {
            cv.wait_for(lock, std::chrono::seconds(5), [this] { return inFlight >= awaitConcurrency || peak >= awaitConcurrency; });
        }
    }

    void leave() {
        std::lock_guard<std::mutex> lock(mtx);
        --inFlight;
    }

    mutable std::mutex mtx;
    std::condition_variable cv;
    std::size_t inFlight = 0;
    std::size_t peak = 0;
};

class FakeHttpClient : public HttpClient {
public:
    explicit FakeHttpClient(FakeServer& server) : server(server) {}

    bool head(HttpHeadResult& out) override { return server.head(out); }
    bool getRange(const std::string& rangeHeaderValue, HttpRangeResult& out) override { return server.getRange(rangeHeaderValue, out); }

private:
    FakeServer& server;
};

inline std::unique_ptr<HttpClient> FakeServer::makeClient(const std::string&) {
    return std::make_unique<FakeHttpClient>(*this);
}

struct WriteCall {
    std::uint64_t offset;
    std::size_t size;
};

// Random access writer over a growable byte buffer.
class MemoryWriter : public RandomAccessWriter {
public:
    std::size_t maxChunk = 0; // > 0: accept at most this many bytes per call
    bool failAll = false;

    bool writeAt(const char* data, std::size_t size, std::uint64_t offset, std::size_t& written, std::string& error) override {
        std::lock_guard<std::mutex> lock(mtx);
        written = 0;
        if (failAll) {
            error = "No space left on device";
            return false;
        }

        const std::size_t n = maxChunk > 0 ? std::min(maxChunk, size) : size;
        if (buffer.size() < offset + n) {
            buffer.resize(offset + n, '\0');
        }
        std::copy(data, data + n, buffer.begin() + offset);
        calls.push_back({offset, n});
        written = n;
        return true;
    }

    std::string contents() const {
        std::lock_guard<std::mutex> lock(mtx);
        return std::string(buffer.begin(), buffer.end());
    }

    std::vector<WriteCall> writes() const {
        std::lock_guard<std::mutex> lock(mtx);
        return calls;
    }

private:
    mutable std::mutex mtx;
    std::vector<char> buffer;
    std::vector<WriteCall> calls;
};

inline std::string makePayload(std::size_t size) {
    std::string s(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        s[i] = static_cast<char>('a' + (i * 7 + i / 26) % 26);
    }
    return s;
}

} // namespace bdmtest
