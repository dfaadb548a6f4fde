/* ipcsrv: Connection server
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */


#include "ipcsrv/test/test_config.hpp"
#include <gtest/gtest.h>
#include <cstring>
#include <sstream>

/* Entry point for the unit-test suite.  Beyond the usual GoogleTest flags, accepts `--ipcsrv-log-sev=<severity>`
 * (e.g., `TRACE`, `DATA`) to control Test_logger verbosity. */
int main(int argc, char** argv)
{
  using ipcsrv::test::Test_config;
  using flow::log::Sev;

  testing::InitGoogleTest(&argc, argv);

  const char* const SEV_ARG = "--ipcsrv-log-sev=";
  for (int idx = 1; idx < argc; ++idx)
  {
    if (std::strncmp(argv[idx], SEV_ARG, std::strlen(SEV_ARG)) == 0)
    {
      std::istringstream is(argv[idx] + std::strlen(SEV_ARG));
      Sev sev;
      if (is >> sev)
      {
        Test_config::get_singleton().m_sev = sev;
      }
    }
  }

  return RUN_ALL_TESTS();
}
