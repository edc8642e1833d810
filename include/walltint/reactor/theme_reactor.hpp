#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include "walltint/cache/wallpaper_identity.hpp"
#include "walltint/color/semantic_palette.hpp"
#include "walltint/reactor/theme_event_sink.hpp"
#include "walltint/theme_types.hpp"

namespace walltint::apply
{
  class ThemeApplier;
}
namespace walltint::cache
{
  class PaletteCache;
}
namespace walltint::sampling
{
  class ColorSampler;
  class ImageSource;
}
namespace walltint::synthesis
{
  class PaletteSynthesizer;
}

namespace walltint::reactor
{
  class WorkerPool;

  enum class OutputState : std::uint8_t
  {
    Idle,
    Pending,
    Computing,
    Applying
  };

  std::string_view toString(OutputState s) noexcept;

  struct Transition
  {
    std::string outputId;
    OutputState from{OutputState::Idle};
    OutputState to{OutputState::Idle};
    std::optional<cache::ThemeKey> key;
  };

  struct ReactorConfig
  {
    std::chrono::milliseconds debounce{200};
    Mode initialMode{Mode::Dark};
    bool prewarmOtherMode{true}; // synthesize the opposite mode from the same samples on a miss
  };

  // Per-output theme state machine: Idle -> Pending -> Computing -> Applying -> Idle.
  //
  // Notifications are queued and handled on one event thread. Bursts for an output are coalesced
  // for the debounce window (last key wins); cache lookups, sampling, synthesis and applying run on
  // the worker pool with at most one job per output. A change that arrives while an output is busy
  // is parked and started once the running cycle ends; a computed palette that has been overtaken
  // that way is dropped instead of applied.
  class ThemeReactor final : public ThemeEventSink
  {
  public:
    using ListenerID = std::uint64_t;
    using Clock = std::chrono::steady_clock;

    ThemeReactor(const ReactorConfig &cfg, cache::PaletteCache &cache, const sampling::ImageSource &images,
                 const sampling::ColorSampler &sampler, const synthesis::PaletteSynthesizer &synthesizer,
                 apply::ThemeApplier &applier, WorkerPool &pool);
    ~ThemeReactor() override;

    ThemeReactor(const ThemeReactor &) = delete;
    ThemeReactor &operator=(const ThemeReactor &) = delete;

    void start();
    // Drops not-yet-started work, waits for running jobs, joins the event thread.
    void stop();

    void notifyWallpaperChanged(const std::string &outputId, const std::string &imageRef) override;
    void notifyModeChanged(Mode mode) override;

    // Re-runs the output's current wallpaper/mode (identity is recomputed from the file).
    void refresh(const std::string &outputId);

    // True once no output has pending or running work.
    bool waitIdle(std::chrono::milliseconds timeout);

    Mode mode() const;
    OutputState state(const std::string &outputId) const;

    // Called on the event thread for every state change of every output.
    ListenerID addListener(std::function<void(const Transition &)> fn);
    void removeListener(ListenerID id);

  private:
    struct Target
    {
      cache::ThemeKey key;
      std::string imageRef;
    };

    struct Slot
    {
      OutputState state{OutputState::Idle};
      std::string imageRef;
      std::optional<cache::WallpaperIdentity> identity;

      std::optional<Target> pending;
      Clock::time_point deadline{};

      std::optional<Target> active;

      std::optional<Target> queued;
      Clock::time_point queuedDeadline{};
    };

    struct ComputeResult
    {
      color::SemanticPalette palette{};
      bool fromCache{false};
      ErrorCode error{ErrorCode::None};
    };

    enum class EventKind : std::uint8_t
    {
      Wallpaper,
      ModeChange,
      Refresh,
      ComputeDone,
      ApplyDone
    };

    struct Event
    {
      EventKind kind{EventKind::Wallpaper};
      std::string outputId;
      std::string imageRef;
      std::optional<cache::WallpaperIdentity> identity;
      Mode mode{Mode::Dark};
      ComputeResult result{};
    };

    using Transitions = std::vector<Transition>;
    using Jobs = std::vector<std::function<void()>>;

    void push(Event ev);
    void eventLoop();
    void handle(Event &ev, Clock::time_point now, Transitions &emitted, Jobs &jobs);

    void retarget(const std::string &outputId, Slot &slot, Target target, Clock::time_point now,
                  Transitions &emitted);
    void startCompute(const std::string &outputId, Slot &slot, Transitions &emitted, Jobs &jobs);
    void startApply(const std::string &outputId, Slot &slot, const color::SemanticPalette &palette, Jobs &jobs,
                    Transitions &emitted);
    void promoteQueued(const std::string &outputId, Slot &slot, Transitions &emitted);
    void setState(const std::string &outputId, Slot &slot, OutputState to, Transitions &emitted);

    void fireDue(Clock::time_point now, Transitions &emitted, Jobs &jobs);
    void dropPending(Transitions &emitted);
    std::optional<Clock::time_point> nextDeadline() const;
    bool allIdleLocked() const;

    // Runs on a worker thread.
    ComputeResult compute(const Target &target) const;

    void notifyListeners(const Transitions &emitted);

    ReactorConfig m_cfg;
    cache::PaletteCache &m_cache;
    const sampling::ImageSource &m_images;
    const sampling::ColorSampler &m_sampler;
    const synthesis::PaletteSynthesizer &m_synth;
    apply::ThemeApplier &m_applier;
    WorkerPool &m_pool;

    mutable std::mutex m_mtx;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    std::deque<Event> m_events;
    std::map<std::string, Slot> m_slots;
    Mode m_mode;
    int m_inflight{0};
    bool m_running{false};
    bool m_stopping{false};
    bool m_dispatching{false};
    bool m_wakeup{false};
    std::thread m_thread;

    std::mutex m_listenerMtx;
    std::unordered_map<ListenerID, std::function<void(const Transition &)>> m_listeners;
    ListenerID m_nextListenerId{1};
  };

} // namespace walltint::reactor
