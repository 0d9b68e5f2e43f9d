#include "usersvc/app/errors.h"
#include "usersvc/app/logger.h"
#include "usersvc/db/mysql_pool.h"
#include "usersvc/model/user_dao.h"

#include <gtest/gtest.h>

using namespace usersvc;

class MySqlSetupTest : public ::testing::Test {
protected:
  void SetUp() override { set_log_level(LogLevel::Error); }
  void TearDown() override { set_log_level(LogLevel::Info); }
};

TEST_F(MySqlSetupTest, ResolvesNumericAddress) {
  EXPECT_EQ(resolve_host("127.0.0.1", 3306), "127.0.0.1");
}

TEST_F(MySqlSetupTest, UnresolvableHostIsConnectError) {
  EXPECT_THROW(resolve_host("no-such-host.invalid", 3306), ConnectError);
}

TEST_F(MySqlSetupTest, ListQuerySelectsFourColumns) {
  EXPECT_EQ(list_users_sql("users"), "SELECT id, username, email, full_name FROM `users`");
}

TEST_F(MySqlSetupTest, RefusedConnectionAbortsPoolCreation) {
  DbConfig cfg;
  cfg.host = "127.0.0.1";
  cfg.port = 1;  // nothing listens here
  cfg.database = "app";
  cfg.user = "reader";
  cfg.password = "x";
  cfg.tls = false;
  cfg.connect_timeout = 2;
  cfg.pool_size = 2;
  EXPECT_THROW(make_mysql_pool(cfg), ConnectError);
}
