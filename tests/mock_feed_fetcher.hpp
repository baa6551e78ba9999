#pragma once

#include <string>

#include <gmock/gmock.h>

#include "feed_fetcher.hpp"

class MockFeedFetcher : public IFeedFetcher {
   public:
    MOCK_METHOD(std::string, fetch, (const std::string& url), (override));
};
