#ifndef fl_leader_elector_hpp
#define fl_leader_elector_hpp

#include <fl/active_completion_queue.hpp>
#include <fl/elector.hpp>
#include <fl/elector_config.hpp>

#include <grpc++/grpc++.h>

#include <memory>

namespace fl {

/**
 * Campaign for an advisory lock held in etcd.
 *
 * The store RPCs and the session keep alives complete in @a queue, which can be shared by many electors.  Each
 * leader_elector owns a second queue and thread for its poll loop, the transition callbacks run in that thread.
 */
class leader_elector : public elector {
public:
  /**
   * Constructor, does not contact etcd until start() or try_acquire_once().
   *
   * @throws std::invalid_argument if @a config is not valid.
   */
  leader_elector(
      std::shared_ptr<active_completion_queue> queue, std::shared_ptr<grpc::Channel> etcd_channel,
      lock_identifier lock, elector_config config = elector_config());

  /**
   * Stop the elector, releasing the lock and the session if needed.
   *
   * The application should call stop() before the destructor, that way it can choose which thread blocks on the
   * release.
   */
  ~leader_elector() noexcept(false);

  //@{
  /// @name implement elector interface using pimpl idiom.
  void start(callback_type on_become_leader, callback_type on_lose_leadership) override;
  void stop() override;
  bool is_leader() const override {
    return impl_->is_leader();
  }
  bool try_acquire_once() override {
    return impl_->try_acquire_once();
  }
  lock_identifier const& lock() const override {
    return impl_->lock();
  }
  //@}

  /// The queue running the poll loop and the transition callbacks, mostly for tests and debugging.
  active_completion_queue& loop_queue() {
    return loop_;
  }

private:
  std::shared_ptr<active_completion_queue> queue_;
  std::shared_ptr<grpc::Channel> channel_;
  active_completion_queue loop_;
  std::unique_ptr<elector> impl_;
};

} // namespace fl

#endif // fl_leader_elector_hpp
