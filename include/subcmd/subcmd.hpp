/**
 * @file subcmd.hpp
 * @brief Umbrella header: commands, processes, broadcasters and the test
 *        double.
 */

#ifndef SUBCMD_SUBCMD_HPP_
#define SUBCMD_SUBCMD_HPP_

#include "subcmd/platform.hpp"
#include "subcmd/vocabulary.hpp"
#include "subcmd/log.hpp"
#include "subcmd/stream.hpp"
#include "subcmd/broadcaster.hpp"
#include "subcmd/subprocess.hpp"
#include "subcmd/command.hpp"
#include "subcmd/test_command.hpp"

#endif  // SUBCMD_SUBCMD_HPP_
