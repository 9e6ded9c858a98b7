#include "cr/orchestrator/activation.h"

#include <cassert>
#include <iostream>
#include <string>

#include "cr/error.h"

namespace {

using cr::orchestrator::AcceptsCar;
using cr::orchestrator::ParseActivation;
using cr::orchestrator::ParseRangeQuery;
using cr::orchestrator::StripRangeParameter;

int QueryErrorCode(const std::string& query) {
  try {
    (void)ParseRangeQuery(query);
  } catch (const cr::Error& err) {
    assert(err.domain == cr::ErrorDomain::Validation);
    return err.code;
  }
  return 0;
}

void TestAccept() {
  assert(AcceptsCar("application/vnd.ipld.car"));
  assert(AcceptsCar("application/vnd.ipld.car; version=1; order=dfs"));
  assert(AcceptsCar("text/html, Application/VND.IPLD.CAR;q=0.5"));
  assert(!AcceptsCar("application/vnd.ipld.raw"));
  assert(!AcceptsCar("application/vnd.ipld.car-extra"));
  assert(!AcceptsCar("*/*"));
  assert(!AcceptsCar(""));
}

void TestRangeQuery() {
  auto bytes = ParseRangeQuery("bytes=0:1048576");
  assert(bytes && bytes->start() == 0 && bytes->end() == 1048576u);

  auto entity = ParseRangeQuery("?format=car&entity-bytes=555555:999999");
  assert(entity && entity->start() == 555555 && entity->end() == 999999u);

  auto open = ParseRangeQuery("entity-bytes=100:*&x=1");
  assert(open && open->open_ended() && open->start() == 100);

  auto encoded = ParseRangeQuery("bytes=5%3A9");
  assert(encoded && encoded->start() == 5 && encoded->end() == 9u);

  assert(!ParseRangeQuery("format=car"));
  assert(!ParseRangeQuery(""));
  assert(!ParseRangeQuery("rangebytes=0:1"));

  assert(QueryErrorCode("bytes=10") == cr::errors::validation::kInvalidQuery);
  assert(QueryErrorCode("bytes=a:b") == cr::errors::validation::kInvalidQuery);
  assert(QueryErrorCode("bytes=:5") == cr::errors::validation::kInvalidQuery);
  assert(QueryErrorCode("bytes=-1:5") == cr::errors::validation::kInvalidQuery);
  assert(QueryErrorCode("bytes") == cr::errors::validation::kInvalidQuery);
  assert(QueryErrorCode("bytes=1%3") == cr::errors::validation::kInvalidQuery);
  assert(QueryErrorCode("bytes=9:5") == cr::errors::validation::kInvalidRange);
}

void TestActivation() {
  auto active = ParseActivation("application/vnd.ipld.car", "bytes=0:10");
  assert(active && active->end() == 10u);
  assert(!ParseActivation("application/octet-stream", "bytes=0:10"));
  assert(!ParseActivation("application/vnd.ipld.car", "format=car"));
}

void TestStrip() {
  assert(StripRangeParameter("bytes=0:10") == "");
  assert(StripRangeParameter("format=car&bytes=0:10&dag-scope=entity") == "format=car&dag-scope=entity");
  assert(StripRangeParameter("?entity-bytes=0:*&format=car") == "?format=car");
  assert(StripRangeParameter("a=1&&b=2") == "a=1&b=2");
  assert(StripRangeParameter("bytesize=3") == "bytesize=3");
}

}  // namespace

int main() {
  TestAccept();
  TestRangeQuery();
  TestActivation();
  TestStrip();
  std::cout << "activation tests ok\n";
  return 0;
}
