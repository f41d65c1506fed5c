// ------------------------------------------------------------------
// CTPN region proposal core : region proposal head
// ------------------------------------------------------------------
#ifndef CTPN_RPN_HEAD_HPP_
#define CTPN_RPN_HEAD_HPP_

#include <vector>
#include <boost/shared_ptr.hpp>
#include <opencv2/core/core.hpp>

#include "ctpn/common.hpp"
#include "ctpn/RPN/util/rpn_utils.hpp"
#include "ctpn/RPN/util/rpn_param.hpp"
#include "ctpn/RPN/rpn_anchor_generator.hpp"
#include "ctpn/RPN/rpn_anchor_target.hpp"
#include "ctpn/RPN/rpn_proposal.hpp"
#include "ctpn/RPN/rpn_loss.hpp"

namespace ctpn {

namespace Rpn {

enum RpnMode { TRAIN, TEST };

// Raw outputs of the classification and regression branches for one image.
// cls_score : H x W x 2A logits, channel a is background and A + a is
//             foreground for anchor a of a cell
// bbox_pred : H x W x 4A deltas, anchor a uses channels 4a .. 4a + 3
template <typename Dtype>
struct FeatureMap {
  int height;
  int width;
  int num_anchors;
  vector<Dtype> cls_score;
  vector<Dtype> bbox_pred;

  FeatureMap() : height(0), width(0), num_anchors(0) {}
  FeatureMap(int height_, int width_, int num_anchors_)
      : height(height_), width(width_), num_anchors(num_anchors_),
        cls_score(height_ * width_ * num_anchors_ * 2, Dtype(0)),
        bbox_pred(height_ * width_ * num_anchors_ * 4, Dtype(0)) {}

  inline int count() const { return height * width * num_anchors; }
  inline Dtype bg_score(int anchor) const {
    return cls_score[(anchor / num_anchors) * 2 * num_anchors + anchor % num_anchors];
  }
  inline Dtype fg_score(int anchor) const {
    return cls_score[(anchor / num_anchors) * 2 * num_anchors + num_anchors + anchor % num_anchors];
  }
  inline Point4f<Dtype> delta(int anchor) const {
    return Point4f<Dtype>(&bbox_pred[anchor * 4]);
  }
};

// Dumped branch outputs of one image, as written by an external backbone.
// header : grid_height grid_width num_anchors im_height im_width im_scale
// body   : H*W*2A classification logits, then H*W*4A box deltas
// with_gt: num_gt, then num_gt rows of x1 y1 x2 y2 label
// Returns false, with an error logged, on a missing or malformed file.
template <typename Dtype>
bool load_rpn_dump(const string& path, bool with_gt, FeatureMap<Dtype>& feature_map,
                   ImageInfo<Dtype>& im_info, vector<GtBox<Dtype> >& gt_boxes);

// Backbone plus branch layers, anything that turns an image into a FeatureMap.
template <typename Dtype>
class FeatureExtractor {
 public:
  virtual ~FeatureExtractor() {}
  // The grid must match the configured feature_stride.
  virtual FeatureMap<Dtype> Extract(const cv::Mat& image) = 0;
};

template <typename Dtype>
struct RpnLosses {
  Dtype rpn_cross_entropy;
  Dtype rpn_loss_box;
  Dtype total_loss;
  RpnLosses() : rpn_cross_entropy(0), rpn_loss_box(0), total_loss(0) {}
};

template <typename Dtype>
struct RpnOutput {
  vector<Anchor<Dtype> > anchors;
  // foreground probability and argmax class per anchor
  vector<Dtype> cls_prob;
  vector<int> cls_pred;
  vector<Proposal<Dtype> > rois;
  // TRAIN only
  AnchorTargets<Dtype> targets;
  RpnLosses<Dtype> losses;
  bool has_losses;
  RpnOutput() : has_losses(false) {}
};

/*************************************************
RegionProposalHead
Per image: anchor lattice, proposal decoding and, in TRAIN, anchor target
assignment with the rpn losses. The mode is fixed at construction, in TEST
the decoder is picked by test_mode ("nms" or "top").
No state is kept between calls; randomness comes from the RNG passed to
each TRAIN call.
**************************************************/
template <typename Dtype>
class RegionProposalHead {
 public:
  RegionProposalHead(const RpnParam& param, RpnMode mode,
                     shared_ptr<FeatureExtractor<Dtype> > extractor = shared_ptr<FeatureExtractor<Dtype> >());

  RpnOutput<Dtype> Forward(const FeatureMap<Dtype>& feature_map, const ImageInfo<Dtype>& im_info,
                           const vector<GtBox<Dtype> >& gt_boxes, RNG* rng) const;
  // TEST mode only
  RpnOutput<Dtype> Forward(const FeatureMap<Dtype>& feature_map, const ImageInfo<Dtype>& im_info) const;

  // Runs the extractor first, im_info is taken from the image.
  RpnOutput<Dtype> Forward(const cv::Mat& image, Dtype im_scale,
                           const vector<GtBox<Dtype> >& gt_boxes, RNG* rng) const;

  inline RpnMode mode() const { return mode_; }
  inline const ProposalDecoder<Dtype>& decoder() const { return *decoder_; }
  inline const AnchorGenerator<Dtype>& anchor_generator() const { return generator_; }

 protected:
  RpnLosses<Dtype> ComputeLosses(const FeatureMap<Dtype>& feature_map,
                                 const AnchorTargets<Dtype>& targets) const;

  RpnParam param_;
  RpnMode mode_;
  AnchorGenerator<Dtype> generator_;
  shared_ptr<AnchorTargetAssigner<Dtype> > assigner_;
  shared_ptr<ProposalDecoder<Dtype> > decoder_;
  shared_ptr<FeatureExtractor<Dtype> > extractor_;
};

}  // namespace Rpn

}  // namespace ctpn

#endif  // CTPN_RPN_HEAD_HPP_
