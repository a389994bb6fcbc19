#pragma once
#include <awsid/id/resource_id.hpp>
#include <string_view>
#include <tuple>

namespace awsid {
namespace kind {
/// \brief Network ACL (Access Control List)
struct NetworkAcl {
	static constexpr std::string_view prefix_v{"acl-"};
	static constexpr std::string_view name_v{"AwsNetworkAclId"};
};
/// \brief AMI (Amazon Machine Image)
struct Ami {
	static constexpr std::string_view prefix_v{"ami-"};
	static constexpr std::string_view name_v{"AwsAmiId"};
};
/// \brief Customer Gateway
struct CustomerGateway {
	static constexpr std::string_view prefix_v{"cgw-"};
	static constexpr std::string_view name_v{"AwsCustomerGatewayId"};
};
/// \brief Elastic IP allocation
struct ElasticIp {
	static constexpr std::string_view prefix_v{"eipalloc-"};
	static constexpr std::string_view name_v{"AwsElasticIpId"};
};
/// \brief EFS (Elastic File System)
struct EfsFileSystem {
	static constexpr std::string_view prefix_v{"fs-"};
	static constexpr std::string_view name_v{"AwsEfsFileSystemId"};
};
/// \brief EFS Mount Target
struct EfsMountTarget {
	static constexpr std::string_view prefix_v{"fsmt-"};
	static constexpr std::string_view name_v{"AwsEfsMountTargetId"};
};
/// \brief CloudFormation Stack
struct CloudFormationStack {
	static constexpr std::string_view prefix_v{"stack-"};
	static constexpr std::string_view name_v{"AwsCloudFormationStackId"};
};
/// \brief Elastic Beanstalk Environment
struct ElasticBeanstalkEnvironment {
	static constexpr std::string_view prefix_v{"e-"};
	static constexpr std::string_view name_v{"AwsElasticBeanstalkEnvironmentId"};
};
/// \brief EC2 Instance
struct Instance {
	static constexpr std::string_view prefix_v{"i-"};
	static constexpr std::string_view name_v{"AwsInstanceId"};
};
/// \brief Internet Gateway
struct InternetGateway {
	static constexpr std::string_view prefix_v{"igw-"};
	static constexpr std::string_view name_v{"AwsInternetGatewayId"};
};
/// \brief Key Pair
struct KeyPair {
	static constexpr std::string_view prefix_v{"key-"};
	static constexpr std::string_view name_v{"AwsKeyPairId"};
};
/// \brief Elastic Load Balancer
struct LoadBalancer {
	static constexpr std::string_view prefix_v{"elbv2-"};
	static constexpr std::string_view name_v{"AwsLoadBalancerId"};
};
/// \brief NAT Gateway
struct NatGateway {
	static constexpr std::string_view prefix_v{"nat-"};
	static constexpr std::string_view name_v{"AwsNatGatewayId"};
};
/// \brief Network Interface
struct NetworkInterface {
	static constexpr std::string_view prefix_v{"eni-"};
	static constexpr std::string_view name_v{"AwsNetworkInterfaceId"};
};
/// \brief Placement Group
struct PlacementGroup {
	static constexpr std::string_view prefix_v{"pg-"};
	static constexpr std::string_view name_v{"AwsPlacementGroupId"};
};
/// \brief RDS Instance
struct RdsInstance {
	static constexpr std::string_view prefix_v{"db-"};
	static constexpr std::string_view name_v{"AwsRdsInstanceId"};
};
/// \brief Redshift Cluster
struct RedshiftCluster {
	static constexpr std::string_view prefix_v{"redshift-"};
	static constexpr std::string_view name_v{"AwsRedshiftClusterId"};
};
/// \brief Route Table
struct RouteTable {
	static constexpr std::string_view prefix_v{"rtb-"};
	static constexpr std::string_view name_v{"AwsRouteTableId"};
};
/// \brief Security Group
struct SecurityGroup {
	static constexpr std::string_view prefix_v{"sg-"};
	static constexpr std::string_view name_v{"AwsSecurityGroupId"};
};
/// \brief EBS Snapshot
struct Snapshot {
	static constexpr std::string_view prefix_v{"snap-"};
	static constexpr std::string_view name_v{"AwsSnapshotId"};
};
/// \brief VPC Subnet
struct Subnet {
	static constexpr std::string_view prefix_v{"subnet-"};
	static constexpr std::string_view name_v{"AwsSubnetId"};
};
/// \brief Target Group
struct TargetGroup {
	static constexpr std::string_view prefix_v{"tg-"};
	static constexpr std::string_view name_v{"AwsTargetGroupId"};
};
/// \brief Transit Gateway Attachment
struct TransitGatewayAttachment {
	static constexpr std::string_view prefix_v{"tgw-attach-"};
	static constexpr std::string_view name_v{"AwsTransitGatewayAttachmentId"};
};
/// \brief Transit Gateway
struct TransitGateway {
	static constexpr std::string_view prefix_v{"tgw-"};
	static constexpr std::string_view name_v{"AwsTransitGatewayId"};
};
/// \brief EBS Volume
struct Volume {
	static constexpr std::string_view prefix_v{"vol-"};
	static constexpr std::string_view name_v{"AwsVolumeId"};
};
/// \brief VPC (Virtual Private Cloud)
struct Vpc {
	static constexpr std::string_view prefix_v{"vpc-"};
	static constexpr std::string_view name_v{"AwsVpcId"};
};
/// \brief VPN Connection
struct VpnConnection {
	static constexpr std::string_view prefix_v{"vpn-"};
	static constexpr std::string_view name_v{"AwsVpnConnectionId"};
};
/// \brief VPN Gateway
struct VpnGateway {
	static constexpr std::string_view prefix_v{"vgw-"};
	static constexpr std::string_view name_v{"AwsVpnGatewayId"};
};
} // namespace kind

using AwsNetworkAclId = ResourceId<kind::NetworkAcl>;
using AwsAmiId = ResourceId<kind::Ami>;
using AwsCustomerGatewayId = ResourceId<kind::CustomerGateway>;
using AwsElasticIpId = ResourceId<kind::ElasticIp>;
using AwsEfsFileSystemId = ResourceId<kind::EfsFileSystem>;
using AwsEfsMountTargetId = ResourceId<kind::EfsMountTarget>;
using AwsCloudFormationStackId = ResourceId<kind::CloudFormationStack>;
using AwsElasticBeanstalkEnvironmentId = ResourceId<kind::ElasticBeanstalkEnvironment>;
using AwsInstanceId = ResourceId<kind::Instance>;
using AwsInternetGatewayId = ResourceId<kind::InternetGateway>;
using AwsKeyPairId = ResourceId<kind::KeyPair>;
using AwsLoadBalancerId = ResourceId<kind::LoadBalancer>;
using AwsNatGatewayId = ResourceId<kind::NatGateway>;
using AwsNetworkInterfaceId = ResourceId<kind::NetworkInterface>;
using AwsPlacementGroupId = ResourceId<kind::PlacementGroup>;
using AwsRdsInstanceId = ResourceId<kind::RdsInstance>;
using AwsRedshiftClusterId = ResourceId<kind::RedshiftCluster>;
using AwsRouteTableId = ResourceId<kind::RouteTable>;
using AwsSecurityGroupId = ResourceId<kind::SecurityGroup>;
using AwsSnapshotId = ResourceId<kind::Snapshot>;
using AwsSubnetId = ResourceId<kind::Subnet>;
using AwsTargetGroupId = ResourceId<kind::TargetGroup>;
using AwsTransitGatewayAttachmentId = ResourceId<kind::TransitGatewayAttachment>;
using AwsTransitGatewayId = ResourceId<kind::TransitGateway>;
using AwsVolumeId = ResourceId<kind::Volume>;
using AwsVpcId = ResourceId<kind::Vpc>;
using AwsVpnConnectionId = ResourceId<kind::VpnConnection>;
using AwsVpnGatewayId = ResourceId<kind::VpnGateway>;

///
/// \brief Every concrete id type, for compile-time iteration.
///
using AllResourceIds = std::tuple<
	AwsNetworkAclId,
	AwsAmiId,
	AwsCustomerGatewayId,
	AwsElasticIpId,
	AwsEfsFileSystemId,
	AwsEfsMountTargetId,
	AwsCloudFormationStackId,
	AwsElasticBeanstalkEnvironmentId,
	AwsInstanceId,
	AwsInternetGatewayId,
	AwsKeyPairId,
	AwsLoadBalancerId,
	AwsNatGatewayId,
	AwsNetworkInterfaceId,
	AwsPlacementGroupId,
	AwsRdsInstanceId,
	AwsRedshiftClusterId,
	AwsRouteTableId,
	AwsSecurityGroupId,
	AwsSnapshotId,
	AwsSubnetId,
	AwsTargetGroupId,
	AwsTransitGatewayAttachmentId,
	AwsTransitGatewayId,
	AwsVolumeId,
	AwsVpcId,
	AwsVpnConnectionId,
	AwsVpnGatewayId
>;
} // namespace awsid
