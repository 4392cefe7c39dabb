#include "query_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <echo/echo_planner.hpp>
#include <store/event_store.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

std::string default_output_path(const std::string& target) {
    return strip_whitespace(target) + TABLE_FILE_EXTENSION;
}

QueryCLI::QueryCLI(Config config, ChannelOpener opener)
    : config_(std::move(config)), opener_(std::move(opener)) {}

void QueryCLI::cancel() {
    HorizonsSession* session = active_.load();
    if (session) session->cancel();
}

ObserverTableRequest QueryCLI::make_request(const std::string& start_time,
                                            const std::string& target) const {
    ObserverTableRequest request;
    request.target = target;
    request.start_time = start_time;
    request.step_size = config_.query().step_size;
    request.quantity_code = config_.query().quantity_code;
    return request;
}

ObserverTableResult QueryCLI::query(const ObserverTableRequest& request) {
    HorizonsSession session(config_.session(), opener_);
    active_.store(&session);
    ObserverTableResult result = session.run(request);
    active_.store(nullptr);
    return result;
}

int QueryCLI::run_query(const std::string& start_time, const std::string& target,
                        const std::string& output_path) {
    ObserverTableResult result = query(make_request(start_time, target));

    if (!result.ok()) {
        if (result.failure == FailureKind::AmbiguousMatch) {
            std::cout << result.diagnostic << "\n";
            std::cerr << theme::fail(fmt::format("'{}' matches several bodies", target));
        } else {
            std::cerr << theme::fail(fmt::format("{}: {}", to_string(result.failure), result.diagnostic));
        }
        return exit_code_for(result);
    }

    std::string path = output_path.empty() ? default_output_path(target) : output_path;
    std::ofstream out(path);
    if (!out) {
        std::cerr << theme::fail("Cannot write " + path);
        return 1;
    }
    out << result.table << "\n";
    out.close();
    if (!out) {
        std::error_code ec;
        if (fs::is_regular_file(path, ec)) fs::remove(path, ec);
        echo_log(fmt::format("QueryCLI: write to {} failed", path));
        std::cerr << theme::fail("Failed writing " + path);
        return 1;
    }
    echo_log(fmt::format("QueryCLI: wrote {} ({} bytes)", path, result.table.size()));

    std::cout << result.table << "\n";
    return 0;
}

int QueryCLI::run_track(const std::string& tweet_id, const std::string& created_at,
                        const std::string& mention) {
    int64_t id = 0;
    try {
        id = std::stoll(tweet_id);
    } catch (const std::exception&) {
        std::cerr << theme::fail("Invalid tweet id: " + tweet_id);
        return 1;
    }

    auto created = parse_timestamp(created_at);
    if (!created) {
        std::cerr << theme::fail("Invalid timestamp (want YYYY-MM-DD HH:MM:SS): " + created_at);
        return 1;
    }

    std::string body = mention_body(mention);
    ObserverTableResult result = query(make_request(format_timestamp(*created), body));

    if (result.failure == FailureKind::NotFound) {
        std::cout << not_found_reply();
        return 0;
    }
    if (result.failure == FailureKind::AmbiguousMatch) {
        auto reply = format_candidate_reply(result.diagnostic);
        if (reply.is_err()) {
            std::cerr << theme::fail(reply.error);
            return 1;
        }
        std::cout << reply.value;
        return 2;
    }
    if (!result.ok()) {
        std::cerr << theme::fail(fmt::format("{}: {}", to_string(result.failure), result.diagnostic));
        return 1;
    }

    auto plan = plan_echo(result.table, *created);
    if (plan.is_err()) {
        std::cerr << theme::fail(plan.error);
        return 1;
    }

    EventStore store(config_.store().path);
    EventForm form;
    form.tweet_id = id;
    form.celestial_body = body;
    form.deadline = plan.value.deadline;
    form.round_trip = plan.value.round_trip_secs;

    auto inserted = store.insert(form);
    if (inserted.is_err()) {
        std::cerr << theme::fail(inserted.error);
        return 1;
    }

    std::cerr << theme::ok(fmt::format("Tracking '{}' as event {}", body, inserted.value));
    std::cout << theme::kv("round trip", fmt::format("{:.1f}s", plan.value.round_trip_secs));
    std::cout << theme::kv("deadline", format_timestamp(plan.value.deadline));
    return 0;
}

int QueryCLI::run_due() {
    EventStore store(config_.store().path);
    auto now = std::chrono::system_clock::now();
    auto events = store.due(now);

    if (events.empty()) {
        std::cerr << theme::info("No echoes due");
        return 0;
    }

    std::cout << theme::section("Due echoes");
    for (const auto& e : events) {
        auto deadline = parse_timestamp(e.deadline);
        std::string late = deadline
            ? format_duration(std::chrono::duration_cast<std::chrono::seconds>(now - *deadline))
            : "?";
        std::cout << theme::kv(std::to_string(e.id),
                               fmt::format("{} (tweet {}, due {}, {} ago)",
                                           e.celestial_body, e.tweet_id, e.deadline, late));
    }
    return 0;
}

int QueryCLI::run_replied(const std::string& id) {
    int event_id = safe_stoi(id, -1);
    if (event_id < 0) {
        std::cerr << theme::fail("Invalid event id: " + id);
        return 1;
    }

    EventStore store(config_.store().path);
    auto r = store.mark_replied(event_id);
    if (r.is_err()) {
        std::cerr << theme::fail(r.error);
        return 1;
    }
    std::cerr << theme::ok(fmt::format("Event {} marked replied", event_id));
    return 0;
}
