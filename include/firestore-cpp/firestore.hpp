/// @file firestore.hpp
/// @brief Convenience header that includes the entire firestore-cpp public API.
///
/// Include this single header to access all firestore-cpp types and functions:
/// @code
/// #include <firestore-cpp/firestore.hpp>
/// @endcode

#pragma once

#include <firestore-cpp/auth.hpp>
#include <firestore-cpp/client.hpp>
#include <firestore-cpp/codec.hpp>
#include <firestore-cpp/config.hpp>
#include <firestore-cpp/curl_http_client.hpp>
#include <firestore-cpp/error.hpp>
#include <firestore-cpp/http.hpp>
#include <firestore-cpp/patch.hpp>
#include <firestore-cpp/value.hpp>
