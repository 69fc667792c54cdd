/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 1/20/18.
//

#include "Error.hh"

namespace pxr {

const std::error_category& pxr_error_category()
{
	struct Cat : std::error_category
	{
		Cat() = default;
		const char *name() const noexcept override { return "pxr"; }

		std::string message(int ev) const override
		{
			switch (static_cast<Error>(ev))
			{
				case Error::ok: return "no error";
				case Error::device_timeout: return "timeout while talking to the device";
				case Error::device_unreachable: return "device refused or dropped the connection";
				case Error::not_connected: return "not connected to any device";
				case Error::handshake_rejected: return "device did not answer the handshake";
				case Error::bad_response: return "malformed response from device";
				case Error::command_failed: return "device reported command failure";
				case Error::upload_failed: return "upload failed";
				case Error::too_many_frames: return "too many frames";
				case Error::invalid_image: return "cannot load image";
				case Error::invalid_ip: return "invalid IP address";
				case Error::invalid_interval: return "rotation interval not allowed";
				case Error::empty_selection: return "no item selected";
				case Error::unknown_item: return "unknown item";
				case Error::rotation_inactive: return "rotation is not active";
				case Error::no_saved_config: return "no saved rotation";
				case Error::invalid_config: return "invalid configuration file";
				case Error::invalid_upload_id: return "invalid upload ID";
				default: return "unknown error " + std::to_string(ev);
			}
		}

		std::error_condition default_error_condition(int ev) const noexcept override
		{
			switch (static_cast<Error>(ev))
			{
				case Error::device_timeout:
				case Error::device_unreachable:
				case Error::not_connected:
				case Error::handshake_rejected:
				case Error::bad_response:
					return ErrorKind::connection;

				case Error::too_many_frames:
					return ErrorKind::too_many_frames;

				case Error::command_failed:
				case Error::upload_failed:
				case Error::invalid_image:
					return ErrorKind::upload;

				case Error::invalid_ip:
				case Error::invalid_interval:
				case Error::empty_selection:
				case Error::unknown_item:
				case Error::rotation_inactive:
				case Error::no_saved_config:
				case Error::invalid_config:
				case Error::invalid_upload_id:
					return ErrorKind::validation;

				default:
					return {ev, *this};
			}
		}
	};
	static const Cat cat;
	return cat;
}

const std::error_category& pxr_error_kind_category()
{
	struct Cat : std::error_category
	{
		Cat() = default;
		const char *name() const noexcept override { return "pxr.kind"; }

		std::string message(int ev) const override
		{
			switch (static_cast<ErrorKind>(ev))
			{
				case ErrorKind::connection: return "connection error";
				case ErrorKind::too_many_frames: return "too many frames";
				case ErrorKind::upload: return "upload error";
				case ErrorKind::validation: return "validation error";
				default: return "unknown error kind " + std::to_string(ev);
			}
		}
	};
	static const Cat cat;
	return cat;
}

std::error_code make_error_code(Error err)
{
	return std::error_code(static_cast<int>(err), pxr_error_category());
}

std::error_condition make_error_condition(ErrorKind kind)
{
	return std::error_condition(static_cast<int>(kind), pxr_error_kind_category());
}

} // end of namespace
