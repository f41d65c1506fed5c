// ------------------------------------------------------------------
// CTPN region proposal core : proposal decoding
// ------------------------------------------------------------------
#ifndef CTPN_RPN_PROPOSAL_HPP_
#define CTPN_RPN_PROPOSAL_HPP_

#include <vector>

#include "ctpn/common.hpp"
#include "ctpn/RPN/util/rpn_utils.hpp"
#include "ctpn/RPN/util/rpn_param.hpp"
#include "ctpn/RPN/util/rpn_helper.hpp"

namespace ctpn {

namespace Rpn {

/*************************************************
ProposalDecoder
Outputs object detection proposals by applying estimated bounding-box
transformations to a set of regular boxes (called "anchors").
scores : one foreground probability per anchor
deltas : 4 regression values per anchor, same order as the anchors
**************************************************/
template <typename Dtype>
class ProposalDecoder {
 public:
  virtual ~ProposalDecoder() {}

  virtual vector<Proposal<Dtype> > Decode(const vector<Anchor<Dtype> >& anchors,
      const vector<Dtype>& scores, const vector<Dtype>& deltas,
      const ImageInfo<Dtype>& im_info) const = 0;

  virtual const char* type() const = 0;
};

// Decode, clip, drop small boxes, sort by score, then greedy NMS.
// Output size varies, at most post_nms_top_n.
template <typename Dtype>
class NmsProposalDecoder : public ProposalDecoder<Dtype> {
 public:
  NmsProposalDecoder(int pre_nms_top_n, int post_nms_top_n, Dtype nms_thresh, Dtype min_size);

  virtual vector<Proposal<Dtype> > Decode(const vector<Anchor<Dtype> >& anchors,
      const vector<Dtype>& scores, const vector<Dtype>& deltas,
      const ImageInfo<Dtype>& im_info) const;

  virtual inline const char* type() const { return "nms"; }

 private:
  int pre_nms_top_n_;
  int post_nms_top_n_;
  Dtype nms_thresh_;
  Dtype min_size_;
};

// The top_n highest scoring anchors, decoded and clipped. Always returns
// exactly top_n proposals, padded with zero boxes when there are fewer
// anchors.
template <typename Dtype>
class TopProposalDecoder : public ProposalDecoder<Dtype> {
 public:
  explicit TopProposalDecoder(int top_n);

  virtual vector<Proposal<Dtype> > Decode(const vector<Anchor<Dtype> >& anchors,
      const vector<Dtype>& scores, const vector<Dtype>& deltas,
      const ImageInfo<Dtype>& im_info) const;

  virtual inline const char* type() const { return "top"; }

 private:
  int top_n_;
};

// Greedy non-maximum suppression over proposals already sorted by
// descending score. A box is dropped when its IoU with a kept box reaches
// nms_thresh. Stops after max_keep boxes.
template <typename Dtype>
vector<Proposal<Dtype> > apply_nms(const vector<Proposal<Dtype> >& sorted_proposals,
    Dtype nms_thresh, int max_keep);

}  // namespace Rpn

}  // namespace ctpn

#endif  // CTPN_RPN_PROPOSAL_HPP_
