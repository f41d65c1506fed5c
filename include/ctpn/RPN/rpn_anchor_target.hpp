// ------------------------------------------------------------------
// CTPN region proposal core : anchor target assignment
// ------------------------------------------------------------------
#ifndef CTPN_RPN_ANCHOR_TARGET_HPP_
#define CTPN_RPN_ANCHOR_TARGET_HPP_

#include <vector>

#include "ctpn/common.hpp"
#include "ctpn/RPN/util/rpn_utils.hpp"
#include "ctpn/RPN/util/rpn_param.hpp"
#include "ctpn/RPN/util/rpn_helper.hpp"

namespace ctpn {

namespace Rpn {

// Per-anchor training targets, parallel to the anchor set.
// label: 1 is positive, 0 is negative, -1 is dont care
template <typename Dtype>
struct AnchorTargets {
  vector<int> labels;
  vector<Point4f<Dtype> > bbox_targets;
  vector<Point4f<Dtype> > bbox_inside_weights;
  vector<Point4f<Dtype> > bbox_outside_weights;

  inline int size() const { return static_cast<int>(labels.size()); }
  int count(int label) const;
};

/*************************************************
AnchorTargetAssigner
Assign anchors to ground-truth targets. Produces anchor classification
labels and bounding-box regression targets.
input : anchors, gt_boxes, image width / height, random source
output: labels, bbox_targets, bbox_inside_weights, bbox_outside_weights
**************************************************/
template <typename Dtype>
class AnchorTargetAssigner {
 public:
  explicit AnchorTargetAssigner(const RpnParam& param);

  AnchorTargets<Dtype> Assign(const vector<Anchor<Dtype> >& anchors,
      const vector<GtBox<Dtype> >& gt_boxes, Dtype image_width,
      Dtype image_height, RNG* rng) const;

 protected:
  // Demote random entries of labels equal to target_label to -1 until at
  // most keep_count remain.
  void Subsample(vector<int>& labels, int target_label, int keep_count, RNG* rng) const;

  Dtype border_;
  Dtype positive_overlap_;
  Dtype negative_overlap_;
  bool clobber_positives_;
  Dtype fg_fraction_;
  int batch_size_;
  Point4f<Dtype> inside_weights_;
  Dtype positive_weight_;
};

}  // namespace Rpn

}  // namespace ctpn

#endif  // CTPN_RPN_ANCHOR_TARGET_HPP_
