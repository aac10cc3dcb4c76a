#include "HttpClient.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>

#include <fmt/format.h>
#include <pistache/http.h>

// shared with the client's callbacks, which may fire after send() gave up waiting
struct SPendingReply {
    std::mutex              mtx;
    std::condition_variable cv;
    bool                    done    = false;
    HttpOutcome             outcome = std::unexpected(STransportError{true, "no reply"});
};

HttpOutcome NHttpClient::send(Pistache::Http::Experimental::RequestBuilder& builder, std::chrono::milliseconds timeout) {
    auto pending = std::make_shared<SPendingReply>();

    try {
        builder.timeout(timeout);

        auto resp = builder.send();
        resp.then(
            [pending](Pistache::Http::Response response) {
                std::lock_guard<std::mutex> lg(pending->mtx);
                pending->outcome = SHttpReply{static_cast<int>(response.code()), response.body()};
                pending->done    = true;
                pending->cv.notify_all();
            },
            [pending](std::exception_ptr e) {
                std::string what;
                try {
                    std::rethrow_exception(e);
                } catch (std::exception& e) { what = e.what(); } catch (const std::string& e) { what = e; } catch (const char* e) { what = e; } catch (...) {
                    what = "God knows why";
                }

                std::lock_guard<std::mutex> lg(pending->mtx);
                pending->outcome = std::unexpected(STransportError{what.contains("imeout"), what});
                pending->done    = true;
                pending->cv.notify_all();
            });
    } catch (std::exception& e) { return std::unexpected(STransportError{false, fmt::format("couldn't send request: {}", e.what())}); }

    std::unique_lock<std::mutex> lk(pending->mtx);
    if (!pending->cv.wait_for(lk, timeout, [&pending]() { return pending->done; }))
        return std::unexpected(STransportError{true, fmt::format("no reply within {}ms", timeout.count())});

    return pending->outcome;
}
