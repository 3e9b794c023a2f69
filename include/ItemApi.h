#pragma once

#include <string>

/*
 * Names shared between the item service and the load harness: the
 * environment knobs the service reads, the endpoints it exposes and the
 * line it prints once per worker when it is ready to accept requests.
 */
namespace item_api
{
  // Printed to stderr by every worker once it is accepting connections.
  constexpr const char* kReadyMarker = "Application startup complete.";

  // Environment variables read by the service at startup.
  constexpr const char* kEnvWorkers  = "WEB_CONCURRENCY";
  constexpr const char* kEnvIdLimit  = "ID_LIMIT";
  constexpr const char* kEnvMaxDelay = "MAX_DELAY";

  constexpr int       kDefaultWorkers  = 1;
  constexpr long long kDefaultIdLimit  = 100;
  constexpr double    kDefaultMaxDelay = 0.0;

  // All of them answer the same way, only the name differs.
  constexpr const char* kEndpoints[] = {"people", "planets", "starships"};

  inline std::string ItemBody(long long item_id)
  {
    return "{\"item_id\": " + std::to_string(item_id) + "}";
  }

  inline std::string NotFoundBody(const std::string& item_id)
  {
    return "{\"detail\": \"Item " + item_id + " was not found.\"}";
  }

  inline std::string NotFoundBody(long long item_id)
  {
    return NotFoundBody(std::to_string(item_id));
  }

  inline std::string OverloadedBody()
  {
    return "{\"detail\": \"Server overloaded\"}";
  }
}
