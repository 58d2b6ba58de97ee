/**
 * @page ml-commands meshlink Commands Layer
 * @file commands.hpp
 * @brief Outbound radio commands: send text, reboot, set primary channel.
 * @details
 * PURPOSE
 * -------
 * The commands layer is the write side of meshlink. Reads go through the
 * device reader and the poll scheduler; anything that changes the radio or
 * puts a packet on air goes through here.
 *
 * Every command follows the same five steps:
 *   1. validate arguments          (InvalidArgument, nothing opened yet)
 *   2. open the transport          (Connector::with_transport)
 *   3. check the client capability (UnsupportedOperation("send_text"), ...)
 *   4. invoke the client
 *   5. close the transport         (always, by TransportHandle RAII)
 *
 * RELATIONSHIP TO OTHER FILES
 * ---------------------------
 * - **meshlink/connector.hpp**: resolves the ConnectionSpec and owns the
 *   per-radio lock, so a command never races a poll on the same device.
 * - **meshlink/radio_client.hpp**: the capability query and the calls made here.
 * - **command_dispatch.hpp**: maps service names and JSON arguments onto
 *   these functions.
 *
 * ERRORS
 * ------
 * Failures propagate to the caller as MeshError; a failed command is never
 * retried here.
 *
 * EXAMPLE FLOW
 * ------------
 *   meshlink --send "hello mesh" --to '!a1b2c3d4'
 *     -> send_message(connector, spec, "hello mesh", "!a1b2c3d4")
 *     -> client.send_text("hello mesh", "!a1b2c3d4")
 */
#pragma once

#include "meshlink/connection.hpp"
#include "meshlink/connector.hpp"

#include <optional>
#include <string>

namespace meshlink {

/// True if @p s is empty or only whitespace.
bool is_blank(const std::string& s);

/**
 * @brief Send a text message. Absent or blank @p target broadcasts.
 * @throws MeshError(InvalidArgument) for a blank message, before any open.
 * @throws MeshError(UnsupportedOperation, "send_text")
 */
void send_message(Connector& connector, const ConnectionSpec& spec,
                  const std::string& message,
                  const std::optional<std::string>& target = std::nullopt);

/// @throws MeshError(UnsupportedOperation, "reboot")
void reboot(Connector& connector, const ConnectionSpec& spec);

/**
 * @brief Rename the primary channel.
 * @throws MeshError(InvalidArgument) for a blank name, before any open.
 * @throws MeshError(UnsupportedOperation, "set_primary_channel")
 */
void set_channel(Connector& connector, const ConnectionSpec& spec,
                 const std::string& channel_name);

} // namespace meshlink
