/**
 * @file
 *
 * Helper functions to handle errors reported by gRPC++
 */
#ifndef fl_detail_grpc_errors_hpp
#define fl_detail_grpc_errors_hpp

#include <google/protobuf/message.h>
#include <grpc++/grpc++.h>

#include <iosfwd>
#include <stdexcept>
#include <string>

namespace fl {
namespace detail {

/**
 * A store RPC failed.
 *
 * Raised for any non-OK status, including DEADLINE_EXCEEDED when the per-operation timeout expires.  The elector
 * treats all of them as transient.
 */
class grpc_error : public std::runtime_error {
public:
  grpc_error(std::string const& what, grpc::StatusCode code)
      : std::runtime_error(what)
      , code_(code) {
  }

  grpc::StatusCode code() const {
    return code_;
  }

private:
  grpc::StatusCode code_;
};

/// The name of a status code as spelled in the gRPC documentation, e.g. "UNAVAILABLE".
char const* status_code_name(grpc::StatusCode code);

/**
 * Raise an exception if a gRPC status reports an error.
 *
 * @param status the status to check.
 * @param where the name of the operation, it prefixes the exception message.
 * @throws grpc_error if @a status.ok() is false.
 */
void check_grpc_status(grpc::Status const& status, std::string const& where);

/**
 * Print a protobuf on a single line, for log and exception messages.
 *
 * @code
 * etcdserverpb::TxnRequest const& req = ...;
 * FL_LOG(trace) << "txn " << print_to_stream(req);
 * @endcode
 */
struct print_to_stream {
  explicit print_to_stream(google::protobuf::Message const& m)
      : msg(m) {
  }

  google::protobuf::Message const& msg;
};

std::ostream& operator<<(std::ostream& os, print_to_stream const& x);

} // namespace detail
} // namespace fl

#endif // fl_detail_grpc_errors_hpp
