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


#pragma once

#include <flow/log/simple_ostream_logger.hpp>
#include <ipcsrv/common.hpp>
#include "ipcsrv/test/test_config.hpp"
#include <iostream>

namespace ipcsrv::test
{

/**
 * Logger used by the unit tests: a `Simple_ostream_logger` set up for ipcsrv and Flow log components.  By default
 * it writes to the console; a test that wants to examine the log lines can give it an `ostringstream`.
 */
class Test_logger :
  public flow::log::Logger
{
public:
  /**
   * Constructor.
   *
   * @param min_severity Lowest severity that will pass through logging filter.
   * @param os Where to write all log lines, regardless of severity.
   */
  explicit Test_logger(const flow::log::Sev& min_severity = Test_config::get_singleton().m_sev,
                       std::ostream& os = std::cout) :
    m_config(min_severity),
    m_logger(&m_config, os, os)
  {
    // Yes, it is formally (and practically) fine to do this after the Logger took the m_config ptr already.
    m_config.init_component_to_union_idx_mapping<Log_component>
      (100, flow::log::Config::standard_component_payload_enum_sparse_length<Log_component>());
    m_config.init_component_names<Log_component>(ipcsrv::S_IPCSRV_LOG_COMPONENT_NAME_MAP, false, "ipcsrv-");
    m_config.init_component_to_union_idx_mapping<flow::Flow_log_component>
      (100, flow::log::Config::standard_component_payload_enum_sparse_length<flow::Flow_log_component>());
    m_config.init_component_names<flow::Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "flow-");
    // Now the logging may commence.
  }

  /// Forwards to console Logger.
  bool should_log(flow::log::Sev sev, const flow::log::Component& component) const override
  {
    return m_logger.should_log(sev, component);
  }

  /// Forwards to console Logger.
  bool logs_asynchronously() const override
  {
    return m_logger.logs_asynchronously();
  }

  void do_log(flow::log::Msg_metadata* metadata, flow::util::String_view msg) override
  {
    m_logger.do_log(metadata, msg);
  }

private:
  /// Logging configuration.
  flow::log::Config m_config;

  /// The real logger.
  flow::log::Simple_ostream_logger m_logger;
}; // class Test_logger

} // namespace ipcsrv::test
