#include <shared_data/file_operations/operation_status.hpp>
#include <utility/overloaded.hpp>

namespace SharedData
{
    std::string OperationStatus::statusName() const
    {
        return std::visit(
            Utility::overloaded{
                [](Pending const&) -> std::string {
                    return "Pending";
                },
                [](Running const&) -> std::string {
                    return "Running";
                },
                [](Paused const&) -> std::string {
                    return "Paused";
                },
                [](Completed const&) -> std::string {
                    return "Completed";
                },
                [](Failed const&) -> std::string {
                    return "Failed";
                },
                [](Cancelled const&) -> std::string {
                    return "Cancelled";
                },
            },
            state_);
    }
}
