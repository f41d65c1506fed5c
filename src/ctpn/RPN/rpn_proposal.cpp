// ------------------------------------------------------------------
// CTPN region proposal core : proposal decoding
// ------------------------------------------------------------------

#include "ctpn/RPN/rpn_proposal.hpp"

namespace ctpn {

namespace Rpn {

using std::vector;

namespace {

template <typename Dtype>
void check_decode_inputs(const vector<Anchor<Dtype> >& anchors, const vector<Dtype>& scores,
                         const vector<Dtype>& deltas, const ImageInfo<Dtype>& im_info) {
  CHECK_EQ(anchors.size(), scores.size()) << "one score per anchor is required";
  CHECK_EQ(anchors.size() * 4, deltas.size()) << "four deltas per anchor are required";
  CHECK_GT(im_info.height, 0);
  CHECK_GT(im_info.width, 0);
}

template <typename Dtype>
inline Point4f<Dtype> delta_at(const vector<Dtype>& deltas, size_t index) {
  return Point4f<Dtype>(&deltas[index * 4]);
}

}  // namespace

template <typename Dtype>
vector<Proposal<Dtype> > apply_nms(const vector<Proposal<Dtype> >& sorted_proposals,
    Dtype nms_thresh, int max_keep) {
  const int n_boxes = sorted_proposals.size();
  vector<bool> select(n_boxes, true);
  vector<Proposal<Dtype> > box_final;
  for (int i = 0; i < n_boxes && static_cast<int>(box_final.size()) < max_keep; i++) {
    if (select[i]) {
      for (int j = i + 1; j < n_boxes; j++) {
        if (select[j] && get_iou(sorted_proposals[i], sorted_proposals[j]) >= nms_thresh) {
          select[j] = false;
        }
      }
      box_final.push_back(sorted_proposals[i]);
    }
  }
  return box_final;
}
template vector<Proposal<float> > apply_nms(const vector<Proposal<float> >& sorted_proposals,
    float nms_thresh, int max_keep);
template vector<Proposal<double> > apply_nms(const vector<Proposal<double> >& sorted_proposals,
    double nms_thresh, int max_keep);

template <typename Dtype>
NmsProposalDecoder<Dtype>::NmsProposalDecoder(int pre_nms_top_n, int post_nms_top_n,
    Dtype nms_thresh, Dtype min_size)
    : pre_nms_top_n_(pre_nms_top_n), post_nms_top_n_(post_nms_top_n),
      nms_thresh_(nms_thresh), min_size_(min_size) {
  CHECK_GT(post_nms_top_n_, 0) << "post_nms_top_n : " << post_nms_top_n_;
  LOG(INFO) << "NmsProposalDecoder : pre_nms_top_n " << pre_nms_top_n_
            << " , post_nms_top_n " << post_nms_top_n_ << " , nms_thresh " << nms_thresh_
            << " , min_size " << min_size_;
}

template <typename Dtype>
vector<Proposal<Dtype> > NmsProposalDecoder<Dtype>::Decode(const vector<Anchor<Dtype> >& anchors,
    const vector<Dtype>& scores, const vector<Dtype>& deltas,
    const ImageInfo<Dtype>& im_info) const {
  DLOG(INFO) << "========== enter nms proposal decoder";
  check_decode_inputs(anchors, scores, deltas, im_info);

  const Dtype min_size = im_info.scale * min_size_;
  vector<Proposal<Dtype> > candidates;
  for (size_t i = 0; i < anchors.size(); i++) {
    // 1. apply the predicted deltas, 2. clip predicted boxes to image
    Box<Dtype> cbox = clip_box(bbox_decode<Dtype>(anchors[i], delta_at(deltas, i)),
                               im_info.width, im_info.height);
    // 3. remove predicted boxes with either height or width < threshold
    if (cbox.width() >= min_size && cbox.height() >= min_size) {
      candidates.push_back(Proposal<Dtype>(cbox, scores[i], anchors[i].index));
    }
  }
  DLOG(INFO) << "========== after clip and remove size < threshold box " << candidates.size();

  std::stable_sort(candidates.begin(), candidates.end());
  if (pre_nms_top_n_ > 0 && static_cast<int>(candidates.size()) > pre_nms_top_n_) {
    candidates.erase(candidates.begin() + pre_nms_top_n_, candidates.end());
  }

  DLOG(INFO) << "========== apply nms, pre nms number is : " << candidates.size();
  vector<Proposal<Dtype> > proposals = apply_nms(candidates, nms_thresh_, post_nms_top_n_);
  DLOG(INFO) << "rpn number after nms: " << proposals.size();
  DLOG_IF(INFO, !proposals.empty()) << "best proposal " << proposals[0].to_string();
  LOG_IF(WARNING, proposals.empty()) << "No proposal left";
  return proposals;
}

template <typename Dtype>
TopProposalDecoder<Dtype>::TopProposalDecoder(int top_n) : top_n_(top_n) {
  CHECK_GT(top_n_, 0) << "top_n : " << top_n_;
  LOG(INFO) << "TopProposalDecoder : top_n " << top_n_;
}

template <typename Dtype>
vector<Proposal<Dtype> > TopProposalDecoder<Dtype>::Decode(const vector<Anchor<Dtype> >& anchors,
    const vector<Dtype>& scores, const vector<Dtype>& deltas,
    const ImageInfo<Dtype>& im_info) const {
  DLOG(INFO) << "========== enter top proposal decoder";
  check_decode_inputs(anchors, scores, deltas, im_info);

  typedef pair<Dtype, int> sort_pair;
  vector<sort_pair> sort_vector;
  sort_vector.reserve(anchors.size());
  for (size_t i = 0; i < anchors.size(); i++) {
    // negated score, so ascending order is descending score with lower index first
    sort_vector.push_back(sort_pair(-scores[i], static_cast<int>(i)));
  }
  const int n_top = std::min(static_cast<int>(sort_vector.size()), top_n_);
  std::partial_sort(sort_vector.begin(), sort_vector.begin() + n_top, sort_vector.end());

  vector<Proposal<Dtype> > proposals;
  proposals.reserve(top_n_);
  for (int k = 0; k < n_top; k++) {
    const int i = sort_vector[k].second;
    Box<Dtype> cbox = clip_box(bbox_decode<Dtype>(anchors[i], delta_at(deltas, i)),
                               im_info.width, im_info.height);
    proposals.push_back(Proposal<Dtype>(cbox, scores[i], anchors[i].index));
  }
  DLOG_IF(INFO, n_top > 0) << "best proposal " << proposals[0].to_string();
  LOG_IF(WARNING, n_top < top_n_) << "Only " << n_top << " anchors for " << top_n_
                                   << " top proposals, padding with empty boxes";
  while (static_cast<int>(proposals.size()) < top_n_) {
    proposals.push_back(Proposal<Dtype>());
  }
  return proposals;
}

INSTANTIATE_CLASS(NmsProposalDecoder);
INSTANTIATE_CLASS(TopProposalDecoder);

} // namespace Rpn

} // namespace ctpn
