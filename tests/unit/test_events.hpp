#pragma once

namespace lendcore::tests {

void test_event_sink();

}  // namespace lendcore::tests
