/* Traffic control (tc): setup ingress redirection.
 *
 * The ingress hook of a device can not be shaped directly. We attach an
 * ingress qdisc to it and redirect every packet with a mirred action to
 * the egress path of an IFB device, where regular qdiscs can be attached.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <netlink/route/classifier.h>
#include <netlink/route/qdisc.h>
#include <netlink/route/tc.h>

#include <wanem/kernel/facility.hpp>

namespace wanem {
namespace kernel {

// Forward declarations
class Interface;

namespace tc {

// Handle of the ingress qdisc. All ingress filters are children of it.
constexpr tc_hdl_t INGRESS_HANDLE = TC_HANDLE(0xffff, 0);

// Hash table in which u32 places filters without an explicit table.
constexpr uint32_t U32_DEFAULT_HTID = 0x800;

/* Attach an ingress queuing discipline.
 *
 * @param i[in] The interface
 * @param qd[in,out] The libnl3 object of the new ingress qdisc.
 * @retval 0 Success. Everything went well.
 * @retval <0 Error. Something went wrong.
 */
int ingress(Interface *i, struct rtnl_qdisc **qd);

/* Find the qdisc attached to the ingress hook.
 *
 * This is either an ingress or a clsact qdisc.
 *
 * @param i[in] The interface
 * @param qd[out] The qdisc or nullptr if there is none. Must be released with rtnl_qdisc_put().
 * @retval 0 Success. Everything went well.
 * @retval <0 Error. Something went wrong.
 */
int getIngress(Interface *i, struct rtnl_qdisc **qd);

/* Remove the ingress queuing discipline and all its filters.
 *
 * @param i The interface
 * @retval 0 Success. Everything went well.
 * @retval <0 Error. Something went wrong.
 */
int removeIngress(Interface *i);

/* Add a u32 filter which redirects all ingress traffic to another device.
 *
 * @param i The interface to which this classifier is applied to.
 * @param cls[in,out] The libnl3 object of the new classifier.
 * @param prio The priority of the filter
 * @param node The u32 node id of the filter in the default hash table
 * @param target The device which receives the redirected packets on its egress path
 * @retval 0 Success. Everything went well.
 * @retval <0 Error. Something went wrong.
 */
int redirect(Interface *i, struct rtnl_cls **cls, uint16_t prio, uint32_t node,
             Interface *target);

/* Get all filters attached to the ingress qdisc.
 *
 * @param i The interface
 * @param cache[out] A cache of rtnl_cls objects. Must be freed with nl_cache_free().
 * @retval 0 Success. Everything went well.
 * @retval <0 Error. Something went wrong.
 */
int getFilters(Interface *i, struct nl_cache **cache);

/* Remove a single u32 filter from the ingress qdisc.
 *
 * Other filters with the same priority are kept.
 *
 * @param i The interface
 * @param prio The priority of the filter
 * @param handle The u32 handle of the filter
 * @retval 0 Success. Everything went well.
 * @retval <0 Error. Something went wrong.
 */
int removeFilter(Interface *i, uint16_t prio, tc_hdl_t handle);

} // namespace tc
} // namespace kernel
} // namespace wanem
