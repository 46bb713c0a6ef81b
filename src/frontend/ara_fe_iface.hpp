/******************************************************************************\
 * ara_fe_iface.hpp - External C interface for the remote acquisition core.
 *
 * Copyright 2014-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include "ara_defs.h"

// Need to include external interface definitions
#include "anubis_remote_fe.h"

#include <mutex>
#include <string>

#include "Interfaces.hpp"

namespace ara {

// Forwards session events to the callback registered by a C client
class CallbackObserver : public SessionObserver {
private: // members
    std::mutex m_mutex;
    ara_state_callback_t m_callback = nullptr;
    void* m_userData = nullptr;

public: // interface
    void setCallback(ara_state_callback_t callback, void* userData);
    void onStateChange(SessionEvent const& event) override;
};

class FE_iface final {
private: // Static internal data
    // Error string we export to callers - we want this to leak!
    static char *       _ara_err_str;
    static std::string  m_err_str;
    static std::mutex   m_err_mutex;
    // Attribs string we export to callers - we want this to leak!
    static char *       _ara_attr_str;

private:
    // Used to set the external facing error string
    static void set_error_str(std::string str);

public:
    // Used to obtain a pointer to the internal error string.
    // This is for external consumption.
    static const char *get_error_str();
    // Copy the internal error string into a caller buffer
    static void copy_error_str(char *buf, size_t buf_len);
    // Used to obtain a pointer to the internal attribute string.
    static const char *get_attr_str(const char *value);

    // Return codes
    static constexpr auto SUCCESS = int{0};
    static constexpr auto FAILURE = int{1};

    static constexpr auto SESSION_ERROR = ara_session_id_t{0};

    // Safely run code that can throw and use it to set ara error instead.
    // A C api should never allow an exception to escape the runtime.
    template <typename FuncType, typename ReturnType = decltype(std::declval<FuncType>()())>
    static ReturnType
    runSafely(std::string const& caller, FuncType&& func, ReturnType const onError) {
        try {
            return std::forward<FuncType>(func)();
        } catch (std::exception const& ex) {
            auto const message = std::string{ex.what() ? ex.what() : "(null error string)"};
            set_error_str(caller + ": " + message);
            return onError;
        }
    }

public: // Constructor/destructors
    FE_iface() = delete;
};

} /* namespace ara */
