// Copyright (c) 2024 liudegui. MIT License.
// Tests for qbpp::QueryStream.

#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <string>
#include <vector>

#include "fake_postgres_client.hpp"
#include "qbpp/query_stream.hpp"

using namespace qbpp;
using qbpp_test::FakeCursor;
using qbpp_test::FakeCursorLog;

namespace {

struct StreamFixture {
  std::shared_ptr<FakeCursorLog> log = std::make_shared<FakeCursorLog>();
  FakeCursor* cursor = nullptr;

  QueryStream Make(int64_t total_rows, int64_t chunk_size) {
    cursor = new FakeCursor(total_rows, log);
    return QueryStream(std::unique_ptr<RowCursor>(cursor), chunk_size);
  }
};

}  // namespace

TEST_CASE("QueryStream: batches of chunk size", "[query_stream]") {
  StreamFixture f;
  QueryStream stream = f.Make(5, 2);

  std::vector<size_t> sizes;
  std::vector<int64_t> ids;
  QueryResult batch;
  Error err;
  while (stream.Next(&batch, &err)) {
    sizes.push_back(batch.rows.size());
    for (const auto& row : batch.rows) {
      ids.push_back(row.GetInt64("id"));
    }
  }
  REQUIRE(err.ok());
  REQUIRE(sizes == std::vector<size_t>{2, 2, 1});
  REQUIRE(ids == std::vector<int64_t>{1, 2, 3, 4, 5});
  REQUIRE(f.log->read_sizes == std::vector<int64_t>{2, 2, 2, 2});
  REQUIRE(f.log->close_count == 1);
  REQUIRE_FALSE(stream.IsOpen());
}

TEST_CASE("QueryStream: empty result yields nothing", "[query_stream]") {
  StreamFixture f;
  QueryStream stream = f.Make(0, 10);
  QueryResult batch;
  Error err;
  REQUIRE_FALSE(stream.Next(&batch, &err));
  REQUIRE(err.ok());
  REQUIRE(f.log->close_count == 1);
}

TEST_CASE("QueryStream: not restartable", "[query_stream]") {
  StreamFixture f;
  QueryStream stream = f.Make(1, 5);
  QueryResult batch;
  REQUIRE(stream.Next(&batch));
  REQUIRE_FALSE(stream.Next(&batch));
  REQUIRE_FALSE(stream.Next(&batch));
  REQUIRE(f.log->read_sizes.size() == 2);
  REQUIRE(f.log->close_count == 1);
}

TEST_CASE("QueryStream: early close", "[query_stream]") {
  StreamFixture f;
  QueryStream stream = f.Make(10, 3);
  QueryResult batch;
  REQUIRE(stream.Next(&batch));
  REQUIRE(stream.Close().ok());
  REQUIRE(stream.Close().ok());
  REQUIRE(f.log->close_count == 1);

  Error err;
  REQUIRE_FALSE(stream.Next(&batch, &err));
  REQUIRE(err.ok());
}

TEST_CASE("QueryStream: destruction closes the cursor", "[query_stream]") {
  StreamFixture f;
  {
    QueryStream stream = f.Make(10, 3);
    QueryResult batch;
    REQUIRE(stream.Next(&batch));
  }
  REQUIRE(f.log->close_count == 1);
}

TEST_CASE("QueryStream: move transfers ownership", "[query_stream]") {
  StreamFixture f;
  QueryStream first = f.Make(4, 4);
  QueryStream second(std::move(first));
  REQUIRE_FALSE(first.IsOpen());
  REQUIRE(second.IsOpen());

  QueryResult batch;
  REQUIRE(second.Next(&batch));
  REQUIRE(batch.rows.size() == 4);
  second = QueryStream();
  REQUIRE(f.log->close_count == 1);
}

TEST_CASE("QueryStream: read error closes and surfaces", "[query_stream]") {
  StreamFixture f;
  QueryStream stream = f.Make(10, 2);
  f.cursor->fail_read = 2;

  QueryResult batch;
  Error err;
  REQUIRE(stream.Next(&batch, &err));
  REQUIRE(err.ok());
  REQUIRE_FALSE(stream.Next(&batch, &err));
  REQUIRE(err.code == ErrorCode::kIoError);
  REQUIRE(f.log->close_count == 1);
  REQUIRE_FALSE(stream.IsOpen());
}

TEST_CASE("QueryStream: read error wins over close error", "[query_stream]") {
  StreamFixture f;
  QueryStream stream = f.Make(10, 2);
  f.cursor->fail_read = 1;
  f.cursor->close_error = true;

  QueryResult batch;
  Error err;
  REQUIRE_FALSE(stream.Next(&batch, &err));
  REQUIRE(err.code == ErrorCode::kIoError);
  REQUIRE(std::string(err.message) == "read failed");
  REQUIRE(f.log->close_count == 1);
}

TEST_CASE("QueryStream: close error on exhaustion is reported",
          "[query_stream]") {
  StreamFixture f;
  QueryStream stream = f.Make(0, 2);
  f.cursor->close_error = true;

  QueryResult batch;
  Error err;
  REQUIRE_FALSE(stream.Next(&batch, &err));
  REQUIRE(std::string(err.message) == "close failed");
}

TEST_CASE("QueryStream: null out", "[query_stream]") {
  StreamFixture f;
  QueryStream stream = f.Make(3, 2);
  Error err;
  REQUIRE_FALSE(stream.Next(nullptr, &err));
  REQUIRE(err.code == ErrorCode::kNullParam);
  REQUIRE(f.log->read_sizes.empty());
}
