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


#include "ipcsrv/util/process_credentials.hpp"
#include "ipcsrv/test/test_common_util.hpp"
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <gtest/gtest.h>
#include <unistd.h>

namespace ipcsrv::test
{

TEST(Process_credentials_test, Own_credentials)
{
  using util::Process_credentials;

  const auto& creds = get_process_creds();
  EXPECT_EQ(creds.process_id(), ::getpid());
  EXPECT_EQ(creds.user_id(), ::geteuid());
  EXPECT_EQ(creds.group_id(), ::getegid());

  EXPECT_EQ(creds, Process_credentials(::getpid(), ::geteuid(), ::getegid()));
  EXPECT_NE(creds, Process_credentials(::getpid() + 1, ::geteuid(), ::getegid()));

  const auto str = flow::util::ostream_op_string(creds);
  EXPECT_NE(str.find(flow::util::ostream_op_string("pid=", ::getpid())), std::string::npos);
}

TEST(Process_credentials_test, Invoked_as)
{
  const auto invoked_as = get_process_creds().process_invoked_as(); // Throws on error.
  EXPECT_FALSE(invoked_as.empty());
  EXPECT_NE(invoked_as.find("ipcsrv_unit_test"), std::string::npos);

  // A process that does not exist.  PIDs wrap well below this on Linux.
  const util::Process_credentials no_such(0x7ffffff0, 0, 0);
  Error_code err_code;
  EXPECT_TRUE(no_such.process_invoked_as(&err_code).empty());
  EXPECT_TRUE(err_code);
  EXPECT_THROW(no_such.process_invoked_as(), flow::error::Runtime_error);
}

} // namespace ipcsrv::test
