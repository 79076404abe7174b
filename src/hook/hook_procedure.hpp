/**
 * @file hook/hook_procedure.hpp
 * @brief Translation of raw low-level hook callbacks into InputEvents.
 *
 * The OS invokes the hook callback on a thread the library does not control.
 * Everything reachable from `hookProcedure` is noexcept and total over its
 * inputs: unknown messages are passed along the hook chain untouched and
 * every path ends in exactly one `HookApi::callNext`.
 */

#pragma once

#include <cstdint>
#include <optional>

#include <hookwatch/event.hpp>

#include "hook/hook_api.hpp"

namespace hookwatch::detail {

// Window message identifiers delivered as the hook's wParam. The Windows
// backend checks these against <Windows.h> at compile time.
inline constexpr std::uintptr_t kWmKeyDown = 0x0100;
inline constexpr std::uintptr_t kWmKeyUp = 0x0101;
inline constexpr std::uintptr_t kWmSysKeyDown = 0x0104;
inline constexpr std::uintptr_t kWmSysKeyUp = 0x0105;
inline constexpr std::uintptr_t kWmMouseMove = 0x0200;
inline constexpr std::uintptr_t kWmLButtonDown = 0x0201;
inline constexpr std::uintptr_t kWmLButtonUp = 0x0202;
inline constexpr std::uintptr_t kWmRButtonDown = 0x0204;
inline constexpr std::uintptr_t kWmRButtonUp = 0x0205;
inline constexpr std::uintptr_t kWmMButtonDown = 0x0207;
inline constexpr std::uintptr_t kWmMButtonUp = 0x0208;
inline constexpr std::uintptr_t kWmMouseWheel = 0x020A;
inline constexpr std::uintptr_t kWmXButtonDown = 0x020B;
inline constexpr std::uintptr_t kWmXButtonUp = 0x020C;
inline constexpr std::uintptr_t kWmMouseHWheel = 0x020E;

// High word of MSLLHOOKSTRUCT::mouseData for X button messages.
inline constexpr uint32_t kXButton1 = 0x0001;
inline constexpr uint32_t kXButton2 = 0x0002;

/**
 * @brief Classify a keyboard or mouse message.
 * @return The event to publish, or std::nullopt when the message is not a
 * key or button transition (mouse moves, wheel, anything unrecognized).
 */
std::optional<InputEvent> classifyMessage(HookKind kind,
                                          std::uintptr_t message,
                                          const EventDetails &details) noexcept;

/**
 * @brief Body of the low-level hook callback for `kind`.
 *
 * A negative `code`, or no live hook of this kind in the registry, forwards
 * to the next hook without looking at the event. Otherwise a recognized
 * message is published to the event channel. The return value is always the
 * result of `HookApi::callNext` with the original arguments.
 */
std::intptr_t hookProcedure(HookKind kind, int code, std::uintptr_t message,
                            std::intptr_t details) noexcept;

} // namespace hookwatch::detail
