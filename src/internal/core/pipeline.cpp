// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Pipeline Chain Builder                                            ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "conduit/pipeline.hpp"

namespace conduit {

NextDelegate build_pipeline(
    const std::vector<std::shared_ptr<IPipelineBehavior>>& behaviors,
    const RequestContext& context,
    NextDelegate terminal)
{
    NextDelegate next = std::move(terminal);

    for (auto it = behaviors.rbegin(); it != behaviors.rend(); ++it) {
        next = [behavior = *it, &context, inner = std::move(next)]() {
            return behavior->process(context, inner);
        };
    }

    return next;
}

} // namespace conduit
