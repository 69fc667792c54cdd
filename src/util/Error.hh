/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 1/20/18.
//

#pragma once

#include <system_error>

namespace pxr {

enum class Error
{
	ok,

	// talking to the device
	device_timeout,
	device_unreachable,
	not_connected,
	handshake_rejected,
	bad_response,

	// device accepted the request but reported failure
	command_failed,
	upload_failed,
	too_many_frames,
	invalid_image,

	// input validation
	invalid_ip,
	invalid_interval,
	empty_selection,
	unknown_item,
	rotation_inactive,
	no_saved_config,
	invalid_config,
	invalid_upload_id,

	unknown_error
};

/// The four kinds of failures callers are expected to tell apart.
/// Every Error value maps to one of them, so callers can write
/// `if (ec == ErrorKind::connection)`.
enum class ErrorKind
{
	connection = 1,
	too_many_frames,
	upload,
	validation
};

const std::error_category& pxr_error_category();
const std::error_category& pxr_error_kind_category();
std::error_code make_error_code(Error err);
std::error_condition make_error_condition(ErrorKind kind);

} // end of namespace pxr

namespace std
{
	template <> struct is_error_code_enum<pxr::Error> : true_type {};
	template <> struct is_error_condition_enum<pxr::ErrorKind> : true_type {};
}
