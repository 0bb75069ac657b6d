#pragma once
/**
 *  Lance deux étages sur deux threads et attend les deux.
 *
 *  Si le second thread ne peut pas démarrer, `abort` est appelé pour
 *  débloquer le premier, qui est joint avant de relancer l'exception.
 */
#include <thread>
#include <utility>

namespace astream::util
{
template<typename First, typename Second, typename Abort>
void run_stage_pair(First first, Second second, Abort abort)
{
    std::thread a(std::move(first));
    try {
        std::thread b(std::move(second));
        b.join();
    } catch (...) {
        abort();
        a.join();
        throw;
    }
    a.join();
}

} // namespace astream::util
