#pragma once

namespace dwell {

/** Utility base class (inherit privately) for objects that hold mutable shared state and must not
 * be duplicated, such as a Simulation or a ClearingPass.
 *
 * Typical use:
 *
 *     class ClearingPass : private dwell::noncopyable { ... }
 */
class noncopyable {
    protected:
        noncopyable() = default;
        ~noncopyable() = default;
        noncopyable(const noncopyable&) = delete;
        noncopyable& operator=(const noncopyable&) = delete;
};

}
