#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>

#include "API/HttpServer.hpp"
#include "TestDoubles.hpp"

using namespace std::chrono_literals;
using tsched::json::Value;

namespace {

using Request  = http::request<http::string_body>;
using Response = http::response<http::string_body>;

Request makeRequest(http::verb verb, const std::string& target, const std::string& body = "") {
    Request req{verb, target, 11};
    req.set(http::field::host, "localhost");
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
    }
    req.prepare_payload();
    return req;
}

tsched::SchedulerOptions quiet() {
    tsched::SchedulerOptions o;
    o.pollInterval = 10ms;
    o.stopTimeout  = 2s;
    return o;
}

} // namespace

class HttpRouterTest : public ::testing::Test {
protected:
    Response call(http::verb verb, const std::string& target, const std::string& body = "") {
        return handle_request(sched, makeRequest(verb, target, body));
    }

    tsched::test::MemoryTaskStore   store;
    tsched::test::RecordingExecutor executor;
    tsched::Scheduler               sched{store, executor, quiet()};
};

TEST_F(HttpRouterTest, StatusReportsWorkerState) {
    Response res = call(http::verb::get, "/status");
    EXPECT_EQ(res.result(), http::status::ok);
    Value v = Value::parse(res.body());
    EXPECT_EQ(v.getString("status"), "ok");
    EXPECT_FALSE(v.find("running")->asBool());
}

TEST_F(HttpRouterTest, ScheduleListCancel) {
    Response created = call(http::verb::post, "/tasks",
                            R"({"task_id":"r1","task_data":{"agent":"A","action":"go"},"delay_seconds":600,"priority":4})");
    ASSERT_EQ(created.result(), http::status::ok) << created.body();
    EXPECT_EQ(Value::parse(created.body()).getString("task_id"), "r1");

    Response list = call(http::verb::get, "/tasks");
    Value tasks = Value::parse(list.body());
    ASSERT_EQ(tasks.find("pending_tasks")->size(), 1u);
    EXPECT_EQ(tasks.find("pending_tasks")->asArray()[0].find("priority")->asInt(), 4);

    EXPECT_EQ(call(http::verb::delete_, "/tasks/r1").result(), http::status::ok);
    EXPECT_EQ(call(http::verb::delete_, "/tasks/r1").result(), http::status::not_found);
    EXPECT_TRUE(sched.listPending().empty());
}

TEST_F(HttpRouterTest, BadRequestsGetClientErrors) {
    EXPECT_EQ(call(http::verb::post, "/tasks", "{not json").result(), http::status::bad_request);
    EXPECT_EQ(call(http::verb::post, "/tasks", R"({"task_data":{}})").result(), http::status::bad_request);
    EXPECT_EQ(call(http::verb::post, "/tasks", R"({"delay_seconds":5,"recurring":true})").result(), http::status::bad_request);
    EXPECT_EQ(call(http::verb::post, "/commands", R"({"action":"nope"})").result(), http::status::bad_request);
    EXPECT_EQ(call(http::verb::delete_, "/tasks/").result(), http::status::bad_request);
    EXPECT_EQ(call(http::verb::get, "/nowhere").result(), http::status::not_found);
    EXPECT_EQ(call(http::verb::put, "/tasks").result(), http::status::not_found);
}

TEST_F(HttpRouterTest, CancelDecodesTaskIdAndIgnoresQuery) {
    ASSERT_TRUE(sched.schedule(Value::object(), tsched::in(600s), 1, std::string("a b")).ok());

    EXPECT_EQ(call(http::verb::delete_, "/tasks/%zz").result(), http::status::bad_request);
    EXPECT_EQ(call(http::verb::delete_, "/tasks/a%2").result(), http::status::bad_request);
    EXPECT_EQ(call(http::verb::delete_, "/tasks/a%20b?x=1").result(), http::status::ok);
    EXPECT_TRUE(sched.listPending().empty());

    EXPECT_EQ(call(http::verb::get, "/tasks?verbose=1").result(), http::status::ok);
}

TEST_F(HttpRouterTest, FarFutureTaskIsClientErrorAndListingSurvives) {
    Response far = call(http::verb::post, "/tasks", R"({"task_id":"far","execution_time":400000000000})");
    EXPECT_EQ(far.result(), http::status::bad_request);
    EXPECT_EQ(Value::parse(far.body()).getString("error"), "validation");

    Response list = call(http::verb::get, "/tasks");
    EXPECT_EQ(list.result(), http::status::ok);
    EXPECT_EQ(Value::parse(list.body()).find("pending_tasks")->size(), 0u);
}

TEST_F(HttpRouterTest, ControlAndStats) {
    EXPECT_EQ(Value::parse(call(http::verb::post, "/scheduler/start").body()).getString("status"), "success");
    EXPECT_TRUE(sched.isRunning());
    EXPECT_EQ(Value::parse(call(http::verb::post, "/scheduler/start").body()).getString("status"), "info");

    Value stats = Value::parse(call(http::verb::get, "/stats").body());
    EXPECT_TRUE(stats.find("stats")->find("running")->asBool());

    EXPECT_EQ(call(http::verb::post, "/scheduler/stop").result(), http::status::ok);
    EXPECT_FALSE(sched.isRunning());
}

TEST_F(HttpRouterTest, CommandEndpointAcceptsActions) {
    Response r = call(http::verb::post, "/commands",
                      R"({"action":"schedule_task","task_data":{"agent":"A"},"execution_time":{"delay_seconds":60}})");
    EXPECT_EQ(r.result(), http::status::ok);
    EXPECT_EQ(sched.listPending().size(), 1u);
}

TEST(HttpServer, ServesOverTcp) {
    tsched::test::MemoryTaskStore   store;
    tsched::test::RecordingExecutor executor;
    tsched::Scheduler sched(store, executor, quiet());

    TS_HttpServer server("127.0.0.1", 0, sched);
    server.start();
    const uint16_t port = server.port();
    ASSERT_NE(port, 0);
    std::thread th([&] { server.run(); });

    asio::io_context ioc;
    beast::tcp_stream stream(ioc);
    stream.expires_after(5s);
    stream.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));

    auto roundTrip = [&](Request req) {
        http::write(stream, req);
        beast::flat_buffer buf;
        Response res;
        http::read(stream, buf, res);
        return res;
    };

    // keep-alive: несколько запросов по одному соединению
    Response created = roundTrip(makeRequest(http::verb::post, "/tasks",
                                             R"({"task_id":"net","task_data":{"agent":"A"},"delay_seconds":300})"));
    EXPECT_EQ(created.result(), http::status::ok);

    Response list = roundTrip(makeRequest(http::verb::get, "/tasks"));
    EXPECT_EQ(Value::parse(list.body()).find("pending_tasks")->size(), 1u);

    Response gone = roundTrip(makeRequest(http::verb::delete_, "/tasks/unknown"));
    EXPECT_EQ(gone.result(), http::status::not_found);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    server.stop();
    th.join();
}

TEST(HttpServer, SlowStopDoesNotBlockOtherClients) {
    tsched::test::MemoryTaskStore   store;
    tsched::test::RecordingExecutor executor;
    executor.blockOn = {"slow"};
    tsched::SchedulerOptions opts = quiet();
    opts.stopTimeout = 1500ms;
    tsched::Scheduler sched(store, executor, opts);

    TS_HttpServer server("127.0.0.1", 0, sched, 2);
    server.start();
    const uint16_t port = server.port();
    std::thread th([&] { server.run(); });

    ASSERT_TRUE(sched.schedule(Value::object(), tsched::in(0s), 1, std::string("slow")).ok());
    ASSERT_TRUE(sched.start().ok());
    ASSERT_TRUE(executor.waitForCalls(1, 2s));

    auto send = [port](Request req) {
        asio::io_context ioc;
        beast::tcp_stream stream(ioc);
        stream.expires_after(5s);
        stream.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
        http::write(stream, req);
        beast::flat_buffer buf;
        Response res;
        http::read(stream, buf, res);
        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return res;
    };

    // стоп ждёт зависший исполнитель до stopTimeout
    auto stopping = std::async(std::launch::async, [&] { return send(makeRequest(http::verb::post, "/scheduler/stop")); });
    std::this_thread::sleep_for(200ms);

    const auto t0 = std::chrono::steady_clock::now();
    Response status = send(makeRequest(http::verb::get, "/status"));
    const auto elapsed = std::chrono::steady_clock::now() - t0;
    EXPECT_EQ(status.result(), http::status::ok);
    EXPECT_LT(elapsed, 1s);

    EXPECT_EQ(stopping.get().result(), http::status::ok);
    executor.release();
    server.stop();
    th.join();
}
