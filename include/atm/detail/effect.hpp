#ifndef ATM_DETAIL_EFFECT_HPP
#define ATM_DETAIL_EFFECT_HPP

#include <optional>
#include <type_traits>
#include <utility>

#include <atm/detail/concepts.hpp>
#include <atm/detail/types.hpp>

namespace atm
{

namespace policy
{

// dispatch() hands the Report back to the caller
struct ReturnReport
{
};

// dispatch() publishes the Report and returns nothing
template <class Sink>
struct Publisher
{
};

} // namespace policy

template <class P>
concept ReportSink = requires(P& sink, Report report) {
    sink.publish(std::move(report));
};

namespace detail
{

// Drops every report.
struct DiscardReports
{
    void publish(const Report&) const noexcept {}
};

// Appends reports to a caller-owned container; unbound queues drop them.
template <class Journal>
class ReportQueue
{
public:
    using journal_type = Journal;

    ReportQueue() = default;
    explicit ReportQueue(Journal& journal) noexcept : journal_(&journal) {}

    void publish(Report report)
    {
        if(journal_ == nullptr) return;
        journal_->push_back(std::move(report));
    }

private:
    Journal* journal_ = nullptr;
};

template <class EffectPolicy>
struct EffectBindings;

template <>
struct EffectBindings<policy::ReturnReport>
{
    using PublisherStorage = DiscardReports;
    static constexpr bool has_configurable_publisher = false;

    static std::optional<Report> deliver(PublisherStorage&, Report report)
    {
        return report;
    }

    static PublisherStorage default_publisher()
    {
        return {};
    }

    template <class P>
    static PublisherStorage make_publisher_storage(P&&)
    {
        static_assert(always_false<P>::value, "ReturnReport policy takes no publisher");
        return {};
    }
};

template <class Sink>
struct EffectBindings<policy::Publisher<Sink>>
{
    static_assert(ReportSink<Sink>, "Publisher must accept publish(Report)");

    using PublisherStorage = Sink;
    static constexpr bool has_configurable_publisher = true;

    static std::optional<Report> deliver(PublisherStorage& sink, Report report)
    {
        sink.publish(std::move(report));
        return std::nullopt;
    }

    static PublisherStorage default_publisher()
    {
        if constexpr(std::is_default_constructible_v<Sink>)
        {
            return Sink{};
        }
        else
        {
            static_assert(always_false<Sink>::value, "Publisher policy requires Builder::set_publisher()");
            return Sink{};
        }
    }

    template <class P>
    static PublisherStorage make_publisher_storage(P&& sink)
    {
        return PublisherStorage{std::forward<P>(sink)};
    }
};

} // namespace detail

namespace publisher
{
template <class P>
concept Concept = ReportSink<P>;

using NullPublisher = detail::DiscardReports;

template <class Journal>
using Queue = detail::ReportQueue<Journal>;
} // namespace publisher

} // namespace atm

#endif
