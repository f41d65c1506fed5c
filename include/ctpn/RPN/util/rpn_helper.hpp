// ------------------------------------------------------------------
// CTPN region proposal core : box delta parametrization
// ------------------------------------------------------------------
#ifndef CTPN_RPN_HELPER_HPP_
#define CTPN_RPN_HELPER_HPP_

#include "ctpn/RPN/util/rpn_utils.hpp"

namespace ctpn {

namespace Rpn {

// (dx, dy, dw, dh) of gt relative to anchor: center offsets normalized by
// the anchor size, log ratio of the sizes.
template <typename Dtype>
Point4f<Dtype> bbox_encode(const Box<Dtype>& anchor, const Box<Dtype>& gt);

template <typename Dtype>
std::vector<Point4f<Dtype> > bbox_encode(const std::vector<Box<Dtype> >& anchors,
                                         const std::vector<Box<Dtype> >& gts);

// Inverse of bbox_encode.
template <typename Dtype>
Box<Dtype> bbox_decode(const Box<Dtype>& anchor, const Point4f<Dtype>& delta);

template <typename Dtype>
Box<Dtype> clip_box(const Box<Dtype>& box, Dtype image_width, Dtype image_height);

}  // namespace Rpn

}  // namespace ctpn

#endif  // CTPN_RPN_HELPER_HPP_
