// ------------------------------------------------------------------
// CTPN region proposal core : rpn losses
// ------------------------------------------------------------------
#ifndef CTPN_RPN_LOSS_HPP_
#define CTPN_RPN_LOSS_HPP_

#include <vector>

#include "ctpn/common.hpp"
#include "ctpn/RPN/util/rpn_utils.hpp"

namespace ctpn {

namespace Rpn {

/*************************************************
Smooth L1 of one anchor, summed over its 4 coordinates.
  diff = inside_w * (pred - target)
  f(x) = 0.5 * (sigma * x)^2      if |x| < 1 / sigma^2
         |x| - 0.5 / sigma^2      otherwise
  loss = sum(outside_w * f(diff))
**************************************************/
template <typename Dtype>
Dtype smooth_l1(const Point4f<Dtype>& pred, const Point4f<Dtype>& target,
                const Point4f<Dtype>& inside_weights, const Point4f<Dtype>& outside_weights,
                Dtype sigma);

// Mean of smooth_l1 over the batch, 0 for an empty batch.
template <typename Dtype>
Dtype smooth_l1_loss(const vector<Point4f<Dtype> >& preds, const vector<Point4f<Dtype> >& targets,
                     const vector<Point4f<Dtype> >& inside_weights,
                     const vector<Point4f<Dtype> >& outside_weights, Dtype sigma);

// Two-way softmax over (background, foreground) logits.
template <typename Dtype>
Dtype softmax_fg_prob(Dtype bg_logit, Dtype fg_logit);

// -log(softmax(logits)[label]), label is 0 or 1.
template <typename Dtype>
Dtype softmax_cross_entropy(Dtype bg_logit, Dtype fg_logit, int label);

}  // namespace Rpn

}  // namespace ctpn

#endif  // CTPN_RPN_LOSS_HPP_
