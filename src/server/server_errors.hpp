/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

server_errors.hpp - Error taxonomy shared by the room services. Player-facing
messages carried alongside a code must never contain internal detail.*/

#pragma once

#include <string_view>

namespace mmq {

enum class ErrorCode {
	None,
	ValidationRejected,
	CapacityExceeded,
	AuthFailed,
	NotFound,
	TransientProviderFailure,
	FatalLoopError,
	ServerNotReady
};

// WebSocket-style close codes used when refusing a connection.
inline constexpr int kCloseNormal = 1000;
inline constexpr int kClosePolicyViolation = 1008;
inline constexpr int kCloseServerNotReady = 1011;

constexpr std::string_view ErrorCodeName(ErrorCode code) {
	switch (code) {
	case ErrorCode::None:
		return "None";
	case ErrorCode::ValidationRejected:
		return "ValidationRejected";
	case ErrorCode::CapacityExceeded:
		return "CapacityExceeded";
	case ErrorCode::AuthFailed:
		return "AuthFailed";
	case ErrorCode::NotFound:
		return "NotFound";
	case ErrorCode::TransientProviderFailure:
		return "TransientProviderFailure";
	case ErrorCode::ServerNotReady:
		return "ServerNotReady";
	case ErrorCode::FatalLoopError:
	default:
		return "FatalLoopError";
	}
}

} // namespace mmq
