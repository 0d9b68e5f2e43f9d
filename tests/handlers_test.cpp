#include "usersvc/app/errors.h"
#include "usersvc/app/logger.h"
#include "usersvc/db/pool.h"
#include "usersvc/http/handlers.h"

#include <gtest/gtest.h>
#include <httplib.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

using namespace usersvc;
using namespace std::chrono_literals;

namespace {

const char* kTwoUsers =
    R"([{"id":1,"username":"john_doe","email":"john@example.com","full_name":"John Doe","created_at":null,"updated_at":null},)"
    R"({"id":2,"username":"jane_doe","email":"jane@example.com","full_name":"Jane Doe","created_at":null,"updated_at":null}])";

std::vector<User> two_users() {
  User a;
  a.id = 1; a.username = "john_doe"; a.email = "john@example.com"; a.full_name = "John Doe";
  User b;
  b.id = 2; b.username = "jane_doe"; b.email = "jane@example.com"; b.full_name = "Jane Doe";
  return {a, b};
}

class FakeStore : public UserStore {
public:
  explicit FakeStore(std::function<std::vector<User>()> fn) : fn_(std::move(fn)) {}
  std::vector<User> list_users() override { ++calls; return fn_(); }
  std::atomic<int> calls{0};
private:
  std::function<std::vector<User>()> fn_;
};

// One session shared through a pool of size 1, like a single DB connection.
// Rows are produced one at a time so overlapping use would be visible.
struct Session {
  std::atomic<bool> busy{false};
};

class SessionStore : public UserStore {
public:
  SessionStore() {
    std::vector<std::unique_ptr<Session>> s;
    s.push_back(std::make_unique<Session>());
    pool_ = std::make_unique<ConnectionPool<Session>>(std::move(s));
  }

  std::vector<User> list_users() override {
    std::vector<User> out;
    auto lease = pool_->acquire();
    if (lease->busy.exchange(true)) ++overlaps;
    for (const auto& u : two_users()) {
      std::this_thread::sleep_for(2ms);
      out.push_back(u);
    }
    lease->busy = false;
    return out;
  }

  std::atomic<int> overlaps{0};
private:
  std::unique_ptr<ConnectionPool<Session>> pool_;
};

class HandlersTest : public ::testing::Test {
protected:
  void SetUp() override { set_log_level(LogLevel::Error); }
  void TearDown() override { set_log_level(LogLevel::Info); }
};

} // namespace

TEST_F(HandlersTest, HealthIsAlwaysOk) {
  httplib::Response res;
  handle_health(res);
  EXPECT_EQ(res.status, 200);
  EXPECT_EQ(res.body, "\"Server is running!\"");
  EXPECT_EQ(res.get_header_value("Content-Type"), "application/json");
}

TEST_F(HandlersTest, ListUsersReturnsArray) {
  FakeStore store([] { return two_users(); });
  httplib::Response res;
  handle_list_users(store, res);
  EXPECT_EQ(res.status, 200);
  EXPECT_EQ(res.body, kTwoUsers);
}

TEST_F(HandlersTest, EmptyTableGivesEmptyArray) {
  FakeStore store([] { return std::vector<User>{}; });
  httplib::Response res;
  handle_list_users(store, res);
  EXPECT_EQ(res.status, 200);
  EXPECT_EQ(res.body, "[]");
}

TEST_F(HandlersTest, QueryFailureDoesNotLeakDetail) {
  FakeStore store([]() -> std::vector<User> {
    throw QueryError("DB error: Table 'app.users' doesn't exist");
  });
  httplib::Response res;
  handle_list_users(store, res);
  EXPECT_EQ(res.status, 500);
  EXPECT_EQ(res.body, "\"Database query failed\"");
  EXPECT_EQ(res.body.find("doesn't exist"), std::string::npos);
}

TEST_F(HandlersTest, FetchAndMappingFailuresAre500) {
  FakeStore fetch([]() -> std::vector<User> { throw FetchError("Lost connection during query"); });
  httplib::Response r1;
  handle_list_users(fetch, r1);
  EXPECT_EQ(r1.status, 500);
  EXPECT_EQ(r1.body, "\"Failed to process query results\"");

  FakeStore mapping([]() -> std::vector<User> { throw MappingError("row 0: column 'id' is NULL"); });
  httplib::Response r2;
  handle_list_users(mapping, r2);
  EXPECT_EQ(r2.status, 500);
  EXPECT_EQ(r2.body, "\"Failed to process query results\"");
}

TEST_F(HandlersTest, OtherFailuresAreGeneric500) {
  FakeStore store([]() -> std::vector<User> { throw PoolClosed(); });
  httplib::Response res;
  handle_list_users(store, res);
  EXPECT_EQ(res.status, 500);
  EXPECT_EQ(res.body, "\"Internal server error\"");
}

TEST_F(HandlersTest, ConcurrentCallsSeeCompleteResults) {
  SessionStore store;
  constexpr int kRequests = 8;
  std::vector<httplib::Response> responses(kRequests);
  std::vector<std::thread> threads;
  for (int i = 0; i < kRequests; ++i) {
    threads.emplace_back([&, i] { handle_list_users(store, responses[i]); });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(store.overlaps.load(), 0);
  for (const auto& r : responses) {
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.body, kTwoUsers);
  }
}

class ServerTest : public HandlersTest {
protected:
  void start(UserStore& store) {
    install_hooks(svr_);
    install_routes(svr_, store);
    port_ = svr_.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port_, 0);
    thread_ = std::thread([this] { svr_.listen_after_bind(); });
    for (int i = 0; i < 200 && !svr_.is_running(); ++i) std::this_thread::sleep_for(5ms);
    ASSERT_TRUE(svr_.is_running());
  }

  void TearDown() override {
    svr_.stop();
    if (thread_.joinable()) thread_.join();
    HandlersTest::TearDown();
  }

  httplib::Server svr_;
  int port_ = 0;
  std::thread thread_;
};

TEST_F(ServerTest, HealthDoesNotTouchStore) {
  FakeStore store([]() -> std::vector<User> { throw QueryError("should not be called"); });
  start(store);

  httplib::Client cli("127.0.0.1", port_);
  auto res = cli.Get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(res->body, "\"Server is running!\"");
  EXPECT_EQ(store.calls.load(), 0);
}

TEST_F(ServerTest, UsersOverHttp) {
  FakeStore store([] { return two_users(); });
  start(store);

  httplib::Client cli("127.0.0.1", port_);
  auto res = cli.Get("/users?limit=1");  // parameters are ignored
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(res->body, kTwoUsers);

  auto missing = cli.Get("/users/1");
  ASSERT_TRUE(missing);
  EXPECT_EQ(missing->status, 404);
}

TEST_F(ServerTest, QueryFailureOverHttp) {
  FakeStore store([]() -> std::vector<User> { throw QueryError("DB error: Invalid object name 'users'"); });
  start(store);

  httplib::Client cli("127.0.0.1", port_);
  auto res = cli.Get("/users");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 500);
  EXPECT_EQ(res->body, "\"Database query failed\"");
}

TEST_F(ServerTest, ConcurrentRequestsOverHttp) {
  SessionStore store;
  start(store);

  constexpr int kRequests = 6;
  std::vector<int> status(kRequests, 0);
  std::vector<std::string> bodies(kRequests);
  std::vector<std::thread> threads;
  for (int i = 0; i < kRequests; ++i) {
    threads.emplace_back([&, i] {
      httplib::Client cli("127.0.0.1", port_);
      if (auto res = cli.Get("/users")) {
        status[i] = res->status;
        bodies[i] = res->body;
      }
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(store.overlaps.load(), 0);
  for (int i = 0; i < kRequests; ++i) {
    EXPECT_EQ(status[i], 200);
    EXPECT_EQ(bodies[i], kTwoUsers);
  }
}
